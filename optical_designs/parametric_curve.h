// Apertures drawn as strokes of constant width along a curve.
// Author: Philip Salvaggio

#ifndef PARAMETRIC_CURVE_H
#define PARAMETRIC_CURVE_H

#include <opencv2/core/core.hpp>

#include "aperture.h"

namespace apsim {

// count periods of a sine wave across a width of diameter, with a peak to peak
// height of slit_height. The YIN_YANG type adds a dot of inner_diameter on the
// axis below every peak and above every trough.
class Waves : public Aperture {
 public:
  explicit Waves(const ApertureParameters& params);

  virtual ~Waves();

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;
};

// (r sin(rx t + delta), r sin(ry t)) for t in [0, 2 pi], r = diameter / 2.
class Lissajous : public Aperture {
 public:
  explicit Lissajous(const ApertureParameters& params);

  virtual ~Lissajous();

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;
};

// Archimedean spiral arms from the center out to diameter / 2.
class Spiral : public Aperture {
 public:
  explicit Spiral(const ApertureParameters& params);

  virtual ~Spiral();

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;
};

// Closed curve r = diameter / 2 + amplitude * cos(petals * theta).
class Rosette : public Aperture {
 public:
  explicit Rosette(const ApertureParameters& params);

  virtual ~Rosette();

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;
};

// Hand drawn strokes. The path points are normalized to [-1, 1] and scaled to
// half of the diameter. A point with pen_up set ends the current stroke.
class Freeform : public Aperture {
 public:
  explicit Freeform(const ApertureParameters& params);

  virtual ~Freeform();

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;
};

}

#endif  // PARAMETRIC_CURVE_H
