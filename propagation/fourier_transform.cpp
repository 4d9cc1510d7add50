// File Description
// Author: Philip Salvaggio

#include "fourier_transform.h"

#include "base/complex_field.h"
#include "base/fftw_lock.h"
#include "base/math_utils.h"
#include "io/logging.h"

#include <fftw3.h>

#include <iostream>
#include <mutex>

using namespace std;
using namespace cv;

namespace apsim {

bool FourierTransform::Forward(ComplexField* field) {
  return Transform(field, false);
}

bool FourierTransform::Inverse(ComplexField* field) {
  return Transform(field, true);
}

bool FourierTransform::Transform(ComplexField* field, bool inverse) {
  if (!field) return false;

  Mat_<double>& real = field->real_part();
  Mat_<double>& imag = field->imaginary_part();
  const int kSize = real.rows;

  if (real.cols != kSize || imag.rows != kSize || imag.cols != kSize ||
      !IsPowerOfTwo(kSize)) {
    mainLog() << "Error: FFT size must be a square power of two, got "
              << real.rows << " x " << real.cols << "." << endl;
    return false;
  }

  fftw_complex* data = fftw_alloc_complex(kSize * kSize);
  if (!data) {
    mainLog() << "Error: Could not allocate FFT buffer." << endl;
    return false;
  }

  fftw_plan plan;
  {
    lock_guard<mutex> lock(fftw_lock());
    plan = fftw_plan_dft_2d(kSize, kSize, data, data,
                            inverse ? FFTW_BACKWARD : FFTW_FORWARD,
                            FFTW_ESTIMATE);
  }
  if (!plan) {
    mainLog() << "Error: Could not create FFTW plan." << endl;
    fftw_free(data);
    return false;
  }

  for (int i = 0; i < kSize; i++) {
    for (int j = 0; j < kSize; j++) {
      data[i * kSize + j][0] = real(i, j);
      data[i * kSize + j][1] = imag(i, j);
    }
  }

  fftw_execute(plan);

  const double kScale = inverse ? 1.0 / (kSize * kSize) : 1.0;
  for (int i = 0; i < kSize; i++) {
    for (int j = 0; j < kSize; j++) {
      real(i, j) = data[i * kSize + j][0] * kScale;
      imag(i, j) = data[i * kSize + j][1] * kScale;
    }
  }

  {
    lock_guard<mutex> lock(fftw_lock());
    fftw_destroy_plan(plan);
  }
  fftw_free(data);
  return true;
}

}
