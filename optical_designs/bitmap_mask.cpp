// File Description
// Author: Philip Salvaggio

#include "bitmap_mask.h"

#include "base/aperture_geometry.h"
#include "base/simulation_grid.h"
#include "io/logging.h"

#include <opencv2/imgproc/imgproc.hpp>

#include <cmath>
#include <iostream>
#include <vector>

using namespace std;
using namespace cv;

namespace apsim {

BitmapMask::BitmapMask(const ApertureParameters& params, const Mat& bitmap)
    : Aperture(params), bitmap_(bitmap.clone()) {}

BitmapMask::~BitmapMask() {}

bool BitmapMask::Binarize(const Mat& bitmap, int threshold, bool invert,
                          Mat_<double>* binary) {
  if (!binary || bitmap.empty() || bitmap.depth() != CV_8U) return false;

  // The alpha channel does not take part in the mean.
  const int kColorChannels = min(bitmap.channels(), 3);
  vector<Mat> channels;
  split(bitmap, channels);

  Mat_<double> luminance = Mat_<double>::zeros(bitmap.size());
  for (int c = 0; c < kColorChannels; c++) {
    Mat_<double> channel;
    channels[c].convertTo(channel, CV_64F);
    luminance += channel;
  }
  luminance /= kColorChannels;

  cv::threshold(luminance, *binary, threshold, 1,
                invert ? THRESH_BINARY_INV : THRESH_BINARY);
  return true;
}

void BitmapMask::GetApertureTemplate(const SimulationGrid& grid,
                                     MaskPainter*,
                                     Mat_<double>* output) const {
  const double kDiameter = ApertureDiameter(aperture_params());
  if (kDiameter <= 0) return;

  Mat_<double> binary;
  if (!Binarize(bitmap_, aperture_params().mask_threshold(),
                aperture_params().mask_invert(), &binary)) {
    mainLog() << "Warning: Custom aperture has no usable mask image." << endl;
    return;
  }

  // The bitmap's width spans the diameter.
  const double kScale = kDiameter * grid.pixels_per_mm / binary.cols;
  const int kWidth = max(1, static_cast<int>(round(binary.cols * kScale)));
  const int kHeight = max(1, static_cast<int>(round(binary.rows * kScale)));

  Mat_<double> scaled;
  resize(binary, scaled, Size(kWidth, kHeight), 0, 0,
         kScale < 1 ? INTER_AREA : INTER_LINEAR);

  // Rotate about the bitmap center, then move it onto the grid center.
  Mat rotation = getRotationMatrix2D(Point2f(kWidth / 2.0f, kHeight / 2.0f),
                                     -aperture_params().rotation(), 1);
  rotation.at<double>(0, 2) += grid.center() - kWidth / 2.0;
  rotation.at<double>(1, 2) += grid.center() - kHeight / 2.0;

  warpAffine(scaled, *output, rotation, output->size(), INTER_LINEAR,
             BORDER_CONSTANT, Scalar(0));
}

}
