// Self-similar apertures: the Sierpinski carpet and triangle. Both are
// generated with an explicit stack and stop subdividing once the pieces get
// smaller than the grid can resolve.
// Author: Philip Salvaggio

#ifndef FRACTAL_H
#define FRACTAL_H

#include <opencv2/core/core.hpp>

#include "aperture.h"

namespace apsim {

class SierpinskiCarpet : public Aperture {
 public:
  explicit SierpinskiCarpet(const ApertureParameters& params);

  virtual ~SierpinskiCarpet();

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;
};

class SierpinskiTriangle : public Aperture {
 public:
  explicit SierpinskiTriangle(const ApertureParameters& params);

  virtual ~SierpinskiTriangle();

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;
};

}

#endif  // FRACTAL_H
