// File Description
// Author: Philip Salvaggio

#include "angular_spectrum_propagator.h"

#include "base/complex_field.h"
#include "base/simulation_grid.h"
#include "io/logging.h"
#include "propagation/fourier_transform.h"

#include <cmath>
#include <iostream>

using namespace std;
using namespace cv;

namespace apsim {

AngularSpectrumPropagator::AngularSpectrumPropagator() {}

AngularSpectrumPropagator::~AngularSpectrumPropagator() {}

void AngularSpectrumPropagator::GetTransferFunction(const SimulationGrid& grid,
                                                    double distance,
                                                    Mat_<double>* real,
                                                    Mat_<double>* imag) {
  const int kSize = grid.size;
  const int kHalfSize = kSize / 2;
  const double kLambda = grid.wavelength;
  const double kKz = 2 * M_PI / kLambda * distance;
  const double kDeltaFreq = 1 / grid.window;

  real->create(kSize, kSize);
  imag->create(kSize, kSize);

  // FFT bin i holds frequency (i + N/2) mod N - N/2, which is what the
  // centered index (i - N/2) becomes after undoing the shift.
  for (int i = 0; i < kSize; i++) {
    double fy = (((i + kHalfSize) % kSize) - kHalfSize) * kDeltaFreq;
    for (int j = 0; j < kSize; j++) {
      double fx = (((j + kHalfSize) % kSize) - kHalfSize) * kDeltaFreq;

      double val = 1 - pow(kLambda * fx, 2) - pow(kLambda * fy, 2);
      if (val >= 0) {
        double phase = kKz * sqrt(val);
        (*real)(i, j) = cos(phase);
        (*imag)(i, j) = sin(phase);
      } else {
        (*real)(i, j) = exp(-kKz * sqrt(-val));
        (*imag)(i, j) = 0;
      }
    }
  }
}

bool AngularSpectrumPropagator::Propagate(const SimulationGrid& grid,
                                          double distance,
                                          ComplexField* field) const {
  if (!field || field->size() != grid.size) {
    mainLog() << "Error: Field does not match the simulation grid." << endl;
    return false;
  }

  if (!FourierTransform::Forward(field)) return false;

  Mat_<double> h_real, h_imag;
  GetTransferFunction(grid, distance, &h_real, &h_imag);

  Mat_<double>& f_real = field->real_part();
  Mat_<double>& f_imag = field->imaginary_part();
  for (int i = 0; i < grid.size; i++) {
    for (int j = 0; j < grid.size; j++) {
      double a = f_real(i, j), b = f_imag(i, j);
      double c = h_real(i, j), d = h_imag(i, j);
      f_real(i, j) = a * c - b * d;
      f_imag(i, j) = a * d + b * c;
    }
  }

  return FourierTransform::Inverse(field);
}

}
