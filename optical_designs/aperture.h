// Abstraction of a physical aperture placed in front of the sensor.
// Author: Philip Salvaggio

#ifndef APERTURE_H
#define APERTURE_H

#include <opencv2/core/core.hpp>

#include "base/aperture_parameters.pb.h"

namespace apsim {

class MaskPainter;
struct SimulationGrid;

// An aperture is described by its transmission mask over the aperture plane,
// 1 where light passes and 0 where it is blocked. Diffractive apertures that
// are not binary (e.g. sinusoidal zone plates) use the values in between.
class Aperture {
 public:
  // Constructor
  //
  // Arguments:
  //  params     The descriptor of the aperture.
  explicit Aperture(const ApertureParameters& params);

  // Destructor
  virtual ~Aperture();

  // No copy or assignment
  Aperture(const Aperture& other) = delete;
  Aperture& operator=(const Aperture& other) = delete;

  const ApertureParameters& aperture_params() const { return aperture_params_; }

  // Rasterize the aperture onto a simulation grid. The aperture is centered
  // on the grid's center cell and rotated by aperture_params().rotation().
  //
  // Parameters:
  //  grid    Sampling of the aperture plane.
  //  output  Output: grid.size square CV_64F mask with values in [0, 1].
  void GetApertureMask(const SimulationGrid& grid,
                       cv::Mat_<double>* output) const;

 private:
  // Abstract method to draw the aperture.
  //
  // Parameters:
  //  grid     Sampling of the aperture plane.
  //  painter  Painter for drawing primitives, in aperture coordinates.
  //  output   Output: The mask. It is already allocated and zeroed.
  virtual void GetApertureTemplate(const SimulationGrid& grid,
                                   MaskPainter* painter,
                                   cv::Mat_<double>* output) const = 0;

 private:
  ApertureParameters aperture_params_;
};


// Factory class that can be used to construct Aperture subclasses, based on
// the type() in the ApertureParameters protobuf.
class ApertureFactory {
 public:
  ApertureFactory() = delete;

  // Parameters:
  //  params         The aperture descriptor.
  //  imported_mask  Bitmap for CUSTOM apertures. Ignored by other types.
  //
  // Returns:
  //  A new aperture owned by the caller, or nullptr if the type is unknown.
  static Aperture* Create(const ApertureParameters& params,
                          const cv::Mat& imported_mask = cv::Mat());
};

}

#endif  // APERTURE_H
