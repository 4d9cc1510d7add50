// Fresnel zone plates. Zone n has its outer edge at r_n = sqrt(n lambda f),
// so the plate focuses the simulation wavelength at the sensor distance.
// Author: Philip Salvaggio

#ifndef ZONE_PLATE_H
#define ZONE_PLATE_H

#include <opencv2/core/core.hpp>

#include "aperture.h"

namespace apsim {

class ZonePlate : public Aperture {
 public:
  explicit ZonePlate(const ApertureParameters& params);

  virtual ~ZonePlate();

  // Radius of the outer edge of zone n. [mm]
  //
  // Parameters:
  //  n             Zone index, starting at 1
  //  wavelength    [mm]
  //  focal_length  [mm]
  static double ZoneRadius(int n, double wavelength, double focal_length);

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;
};

}

#endif  // ZONE_PLATE_H
