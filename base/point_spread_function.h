// The intensity point spread function of an aperture at the sensor plane,
// normalized so that it sums to 1. Convolving with it redistributes light
// without changing the total exposure.
// Author: Philip Salvaggio

#ifndef POINT_SPREAD_FUNCTION_H
#define POINT_SPREAD_FUNCTION_H

#include <opencv2/core/core.hpp>

namespace apsim {

class ComplexField;
struct SimulationGrid;

class PointSpreadFunction {
 public:
  PointSpreadFunction();

  // PSF of a propagated field, |field|^2 normalized to a unit sum. A field
  // without energy gives the center delta. Fails if the intensity is not
  // finite.
  static bool FromField(const ComplexField& field,
                        PointSpreadFunction* output);

  // Geometric PSF used when diffraction is not rendered: the mask itself,
  // normalized to a unit sum.
  static bool FromMask(const cv::Mat_<double>& mask,
                       PointSpreadFunction* output);

  // A single unit sample at the center of a size x size array.
  static PointSpreadFunction Delta(int size);

  const cv::Mat_<double>& data() const { return psf_; }
  int size() const { return psf_.rows; }

  // Total intensity before normalization. Zero if this PSF fell back to a
  // delta.
  double normalization_sum() const { return normalization_sum_; }

  bool is_delta() const { return is_delta_; }

  // Resample the PSF from grid cells to image pixels. The output has an odd
  // side length of about grid.window * image_pixels_per_mm, its center sample
  // is at (size / 2, size / 2) and it sums to 1. Kernels larger than
  // max_kernel_size are cropped to the central part of the PSF that covers
  // max_kernel_size image pixels.
  //
  // Parameters:
  //  grid                 The grid this PSF was computed on
  //  image_pixels_per_mm  Sampling of the sensor image
  //  max_kernel_size      Largest allowed side length, rounded up to odd
  //  output               Output: the resampled PSF
  bool ResampleToImageScale(const SimulationGrid& grid,
                            double image_pixels_per_mm,
                            int max_kernel_size,
                            PointSpreadFunction* output) const;

 private:
  static bool Normalize(const cv::Mat_<double>& intensity,
                        PointSpreadFunction* output);

  cv::Mat_<double> psf_;
  double normalization_sum_;
  bool is_delta_;
};

}

#endif  // POINT_SPREAD_FUNCTION_H
