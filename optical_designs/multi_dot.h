// Apertures made of many small circular holes.
// Author: Philip Salvaggio

#ifndef MULTI_DOT_H
#define MULTI_DOT_H

#include <opencv2/core/core.hpp>

#include "aperture.h"

namespace apsim {

// count dots of the given diameter, arranged by multi_dot_pattern within a
// radius of spread. RING places them on the circle, LINE along the x axis,
// GRID on a square lattice, CONCENTRIC on five rings and RANDOM uniformly by
// area.
class MultiDot : public Aperture {
 public:
  explicit MultiDot(const ApertureParameters& params);

  virtual ~MultiDot();

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;
};

// A cloud of dots with random sizes.
class RandomDots : public Aperture {
 public:
  explicit RandomDots(const ApertureParameters& params);

  virtual ~RandomDots();

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;
};

// Dots placed on a Fermat spiral with the golden angle between neighbors.
class FibonacciDots : public Aperture {
 public:
  explicit FibonacciDots(const ApertureParameters& params);

  virtual ~FibonacciDots();

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;
};

}

#endif  // MULTI_DOT_H
