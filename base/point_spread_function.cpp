// File Description
// Author: Philip Salvaggio

#include "point_spread_function.h"

#include "base/complex_field.h"
#include "base/simulation_grid.h"
#include "io/logging.h"

#include <opencv2/imgproc/imgproc.hpp>

#include <cmath>
#include <iostream>

using namespace std;
using namespace cv;

namespace apsim {

PointSpreadFunction::PointSpreadFunction()
    : psf_(), normalization_sum_(0), is_delta_(false) {}

bool PointSpreadFunction::FromField(const ComplexField& field,
                                    PointSpreadFunction* output) {
  return Normalize(field.Intensity(), output);
}

bool PointSpreadFunction::FromMask(const Mat_<double>& mask,
                                   PointSpreadFunction* output) {
  return Normalize(mask, output);
}

PointSpreadFunction PointSpreadFunction::Delta(int size) {
  PointSpreadFunction psf;
  psf.psf_ = Mat_<double>::zeros(size, size);
  psf.psf_(size / 2, size / 2) = 1;
  psf.is_delta_ = true;
  return psf;
}

bool PointSpreadFunction::Normalize(const Mat_<double>& intensity,
                                    PointSpreadFunction* output) {
  if (!output || intensity.empty()) return false;

  double energy = sum(intensity)[0];
  if (!std::isfinite(energy) || energy < 0) {
    mainLog() << "Error: PSF energy is " << energy << "." << endl;
    return false;
  }
  if (energy == 0) {
    *output = Delta(intensity.rows);
    return true;
  }

  output->psf_ = intensity / energy;
  output->normalization_sum_ = energy;
  output->is_delta_ = false;
  return true;
}

bool PointSpreadFunction::ResampleToImageScale(
    const SimulationGrid& grid,
    double image_pixels_per_mm,
    int max_kernel_size,
    PointSpreadFunction* output) const {
  if (!output || psf_.empty()) return false;

  double pixels = grid.window * image_pixels_per_mm;
  if (!std::isfinite(pixels) || pixels <= 0 || max_kernel_size <= 0) {
    mainLog() << "Error: Invalid PSF resampling to " << pixels
              << " pixels." << endl;
    return false;
  }

  int kernel_size = max(1, static_cast<int>(round(min(pixels, 1e9))));
  if (kernel_size % 2 == 0) kernel_size++;

  int max_size = max_kernel_size;
  if (max_size % 2 == 0) max_size++;

  // Drop the first row and column, so the center cell is the middle of an
  // odd sized array and stays centered through the resize.
  const int kSize = psf_.rows;
  Mat_<double> centered = psf_(Rect(1, 1, kSize - 1, kSize - 1));

  if (kernel_size > max_size) {
    // Keep only the cells that fall inside max_size image pixels.
    int cells = static_cast<int>(round(max_size * (kSize - 1) / pixels));
    cells = min(kSize - 1, max(1, cells));
    if (cells % 2 == 0) cells++;

    int offset = (kSize - 1 - cells) / 2;
    centered = centered(Rect(offset, offset, cells, cells));
    kernel_size = max_size;
  }

  Mat_<double> resampled;
  resize(centered, resampled, Size(kernel_size, kernel_size), 0, 0,
         kernel_size < centered.rows ? INTER_AREA : INTER_LINEAR);

  double energy = sum(resampled)[0];
  if (!std::isfinite(energy) || energy < 0) {
    mainLog() << "Error: Resampled PSF energy is " << energy << "." << endl;
    return false;
  }
  if (energy == 0) {
    *output = Delta(kernel_size);
    return true;
  }

  output->psf_ = resampled / energy;
  output->normalization_sum_ = normalization_sum_;
  output->is_delta_ = is_delta_;
  return true;
}

}
