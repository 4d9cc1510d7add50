// Circular pinholes and annular (ring) apertures.
// Author: Philip Salvaggio

#ifndef CIRCULAR_H
#define CIRCULAR_H

#include <opencv2/core/core.hpp>

#include "aperture.h"

namespace apsim {

class Circular : public Aperture {
 public:
  explicit Circular(const ApertureParameters& params);

  virtual ~Circular();

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;
};

// Open between inner_diameter and diameter.
class Annular : public Aperture {
 public:
  explicit Annular(const ApertureParameters& params);

  virtual ~Annular();

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;
};

}

#endif  // CIRCULAR_H
