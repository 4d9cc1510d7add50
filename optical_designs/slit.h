// Apertures built from rectangular bars: single slits, crosses, diffraction
// gratings and lithography test features with assist bars.
// Author: Philip Salvaggio

#ifndef SLIT_H
#define SLIT_H

#include <opencv2/core/core.hpp>

#include "aperture.h"

namespace apsim {

// Horizontal bar, diameter long and slit_width wide.
class Slit : public Aperture {
 public:
  explicit Slit(const ApertureParameters& params);

  virtual ~Slit();

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;
};

class Cross : public Aperture {
 public:
  explicit Cross(const ApertureParameters& params);

  virtual ~Cross();

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;
};

// count vertical slits with a center to center spacing of spread.
class SlitArray : public Aperture {
 public:
  explicit SlitArray(const ApertureParameters& params);

  virtual ~SlitArray();

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;
};

// A main line of width diameter and height 5 * diameter, with a sub-resolution
// assist bar of width slit_width on either side at a gap of spread.
class LithoOpc : public Aperture {
 public:
  explicit LithoOpc(const ApertureParameters& params);

  virtual ~LithoOpc();

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;
};

}

#endif  // SLIT_H
