// File Description
// Author: Philip Salvaggio

#include "optics_report.h"

#include "base/aperture_geometry.h"

#include <algorithm>
#include <cmath>
#include <sstream>

using namespace std;

namespace apsim {

double OpenArea(const ApertureParameters& aperture) {
  const double kDiameter = ApertureDiameter(aperture);
  const double kRadius = kDiameter / 2;
  const double kWidth = ApertureSlitWidth(aperture);
  const double kDiscArea = M_PI * kRadius * kRadius;

  switch (aperture.type()) {
    case ApertureParameters::ZONE_PLATE:
      return kDiscArea / 2;
    case ApertureParameters::PHOTON_SIEVE:
      return kDiscArea * 0.3;
    case ApertureParameters::SLIT:
      return kWidth * kDiameter;
    case ApertureParameters::SLIT_ARRAY:
      return ApertureCount(aperture) * kWidth * kDiameter;
    case ApertureParameters::CROSS:
      return 2 * kWidth * kDiameter - kWidth * kWidth;
    case ApertureParameters::ANNULAR: {
      double inner_r = ApertureInnerDiameter(aperture) / 2;
      return M_PI * (kRadius * kRadius - inner_r * inner_r);
    }
    case ApertureParameters::MULTI_DOT:
    case ApertureParameters::RANDOM:
    case ApertureParameters::FIBONACCI:
      return ApertureCount(aperture) * kDiscArea;
    case ApertureParameters::URA:
      return kDiameter * kDiameter / 2;
    case ApertureParameters::WAVES:
    case ApertureParameters::YIN_YANG: {
      int waves = ApertureCount(aperture);
      double amplitude = ApertureAmplitude(aperture);
      double length = hypot(kDiameter, 2 * waves * amplitude);
      double area = length * kWidth;
      if (aperture.type() == ApertureParameters::YIN_YANG) {
        double dot_r = ApertureInnerDiameter(aperture) / 2;
        area += 2 * waves * M_PI * dot_r * dot_r;
      }
      return area;
    }
    case ApertureParameters::LITHO_OPC: {
      double height = 5 * kDiameter;
      return kDiameter * height + 2 * kWidth * height;
    }
    case ApertureParameters::FRACTAL: {
      double side = ApertureSpread(aperture);
      return side * side * pow(8.0 / 9, ApertureIterations(aperture));
    }
    case ApertureParameters::SIERPINSKI_TRIANGLE: {
      double side = ApertureSpread(aperture);
      return sqrt(3.0) / 4 * side * side *
             pow(3.0 / 4, ApertureIterations(aperture));
    }
    case ApertureParameters::LISSAJOUS:
    case ApertureParameters::SPIRAL:
    case ApertureParameters::ROSETTE:
      return 3 * kDiameter * kWidth;
    default:
      return kDiscArea;
  }
}

OpticsReport ComputeOpticsReport(const CameraParameters& camera,
                                 const ApertureParameters& aperture) {
  OpticsReport report;

  const double kFocalLength = max(0.1, camera.focal_length());
  const double kLambda = max(380.0, camera.wavelength()) * 1e-6;
  const double kFeature = FeatureSize(aperture);
  const auto kType = aperture.type();

  report.open_area = OpenArea(aperture);

  // Slits and strokes are limited by their width, the annulus by its outer
  // edge, and everything else by the diameter of a disc of the same area.
  if (IsStrokeShape(kType)) {
    report.effective_diameter = ApertureSlitWidth(aperture);
  } else if (kType == ApertureParameters::LITHO_OPC ||
             kType == ApertureParameters::ANNULAR) {
    report.effective_diameter = ApertureDiameter(aperture);
  } else {
    report.effective_diameter = 2 * sqrt(report.open_area / M_PI);
  }
  report.f_number = kFocalLength / report.effective_diameter;

  report.geometric_blur = kFeature;
  report.diffraction_blur = kAiryDiskFactor * kLambda * kFocalLength /
                            kFeature;
  report.total_blur = hypot(report.geometric_blur, report.diffraction_blur);
  report.diffraction_limited = report.diffraction_blur > report.geometric_blur;

  if (kType == ApertureParameters::ZONE_PLATE ||
      kType == ApertureParameters::PHOTON_SIEVE) {
    int zones = max(1, ApertureZones(aperture));
    report.optimal_diameter = 2 * sqrt(zones * kFocalLength * kLambda);
  } else {
    report.optimal_diameter = kRayleighFactor * sqrt(kFocalLength * kLambda);
  }

  report.fov_horizontal = 2 * atan(camera.sensor_width() /
                                   (2 * kFocalLength)) * 180 / M_PI;
  report.fov_vertical = 2 * atan(camera.sensor_height() /
                                 (2 * kFocalLength)) * 180 / M_PI;

  double diagonal = hypot(camera.sensor_width(), camera.sensor_height());
  double crop_factor = diagonal > 0 ? kFullFrameDiagonal / diagonal : 1;
  report.focal_length_35mm = kFocalLength * crop_factor;

  if (kType == ApertureParameters::SLIT_ARRAY) {
    double spacing = ApertureSpread(aperture);
    if (spacing > 0) {
      report.fringe_spacing = kLambda * kFocalLength / spacing;
      if (report.fringe_spacing < 0.005) {
        report.interference_rating = "Microscopic (Invisible)";
      } else if (report.fringe_spacing < 0.02) {
        report.interference_rating = "Very Weak";
      } else if (report.fringe_spacing < 0.1) {
        report.interference_rating = "Visible (Fine)";
      } else if (report.fringe_spacing < 1.0) {
        report.interference_rating = "Strong / Clear";
      } else {
        report.interference_rating = "Very Wide";
      }
    }
  }

  return report;
}

string PrintOpticsReport(const OpticsReport& report) {
  stringstream output;
  output << "  Open Area: " << report.open_area << " [mm^2]" << endl
         << "  F-Number: f/" << report.f_number << endl
         << "  Geometric Blur: " << report.geometric_blur << " [mm]" << endl
         << "  Diffraction Blur: " << report.diffraction_blur << " [mm]"
           << endl
         << "  Total Blur: " << report.total_blur << " [mm]"
           << (report.diffraction_limited ? " (diffraction limited)" : "")
           << endl
         << "  Optimal Diameter: " << report.optimal_diameter << " [mm]"
           << endl
         << "  Field of View: " << report.fov_horizontal << " x "
           << report.fov_vertical << " [deg]" << endl
         << "  35mm Equivalent: " << report.focal_length_35mm << " [mm]"
           << endl;
  if (report.fringe_spacing > 0) {
    output << "  Fringe Spacing: " << report.fringe_spacing << " [mm], "
           << report.interference_rating << endl;
  }
  return output.str();
}

}
