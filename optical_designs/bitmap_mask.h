// An aperture given by an imported image. The image is thresholded on its
// mean channel value and scaled so that its width spans the aperture
// diameter.
// Author: Philip Salvaggio

#ifndef BITMAP_MASK_H
#define BITMAP_MASK_H

#include <opencv2/core/core.hpp>

#include "aperture.h"

namespace apsim {

class BitmapMask : public Aperture {
 public:
  // Parameters:
  //  params  The aperture descriptor
  //  bitmap  8-bit image with 1, 3 or 4 channels. An empty bitmap gives a
  //          closed aperture.
  BitmapMask(const ApertureParameters& params, const cv::Mat& bitmap);

  virtual ~BitmapMask();

  // Threshold and optionally invert a bitmap.
  //
  // Parameters:
  //  bitmap     The imported image
  //  threshold  Pixels whose mean channel value is above this are open
  //  invert     Swap open and closed
  //  binary     Output: CV_64F with values 0 and 1
  static bool Binarize(const cv::Mat& bitmap, int threshold, bool invert,
                       cv::Mat_<double>* binary);

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;

 private:
  cv::Mat bitmap_;
};

}

#endif  // BITMAP_MASK_H
