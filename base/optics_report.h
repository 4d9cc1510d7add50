// First order optics of a camera with a given aperture: effective f-number,
// blur budget and field of view. These are closed form estimates, meant to be
// shown alongside a simulation.
// Author: Philip Salvaggio

#ifndef OPTICS_REPORT_H
#define OPTICS_REPORT_H

#include "base/aperture_parameters.pb.h"
#include "base/simulation_config.pb.h"

#include <string>

namespace apsim {

struct OpticsReport {
  double open_area = 0;             // Transmitting area [mm^2]
  double effective_diameter = 0;    // [mm]
  double f_number = 0;
  double geometric_blur = 0;        // Projected feature size [mm]
  double diffraction_blur = 0;      // Airy disk diameter [mm]
  double total_blur = 0;            // [mm]
  double optimal_diameter = 0;      // Diameter that balances both blurs [mm]
  double fov_horizontal = 0;        // [deg]
  double fov_vertical = 0;          // [deg]
  double focal_length_35mm = 0;     // Full frame equivalent [mm]
  bool diffraction_limited = false;

  // Only for slit arrays: spacing of the interference fringes on the sensor.
  double fringe_spacing = 0;        // [mm]
  std::string interference_rating;
};

// Constants of the blur budget.
const double kAiryDiskFactor = 2.44;
const double kRayleighFactor = 1.9;
const double kFullFrameDiagonal = 43.266;  // [mm]

// Approximate transmitting area of an aperture. [mm^2]
double OpenArea(const ApertureParameters& aperture);

OpticsReport ComputeOpticsReport(const CameraParameters& camera,
                                 const ApertureParameters& aperture);

std::string PrintOpticsReport(const OpticsReport& report);

}

#endif  // OPTICS_REPORT_H
