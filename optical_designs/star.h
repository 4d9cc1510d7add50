// A star shaped aperture with straight edged spikes.
// Author: Philip Salvaggio

#ifndef STAR_H
#define STAR_H

#include <opencv2/core/core.hpp>

#include "aperture.h"

namespace apsim {

class Star : public Aperture {
 public:
  explicit Star(const ApertureParameters& params);

  virtual ~Star();

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;
};

}

#endif  // STAR_H
