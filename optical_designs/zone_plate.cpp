// File Description
// Author: Philip Salvaggio

#include "zone_plate.h"

#include "base/aperture_geometry.h"
#include "base/mask_painter.h"
#include "base/simulation_grid.h"

#include <algorithm>
#include <cmath>

using namespace std;
using namespace cv;

namespace apsim {

ZonePlate::ZonePlate(const ApertureParameters& params) : Aperture(params) {}

ZonePlate::~ZonePlate() {}

double ZonePlate::ZoneRadius(int n, double wavelength, double focal_length) {
  return sqrt(n * wavelength * focal_length);
}

void ZonePlate::GetApertureTemplate(const SimulationGrid& grid,
                                    MaskPainter* painter,
                                    Mat_<double>* output) const {
  Mat_<double>& mask = *output;

  const double kRadius = ApertureDiameter(aperture_params()) / 2;
  const double kLambdaF = grid.wavelength * grid.focal_length;
  if (kRadius <= 0 || kLambdaF <= 0) return;

  const auto kProfile = aperture_params().zone_plate_profile();

  // Binary plates end on the last complete zone inside the diameter.
  const int kMaxZone = max(1, static_cast<int>(floor(kRadius * kRadius /
                                                     kLambdaF)));
  const double kBinaryR2 = kMaxZone * kLambdaF;
  const double kRadius2 = kRadius * kRadius;

  for (int i = 0; i < mask.rows; i++) {
    for (int j = 0; j < mask.cols; j++) {
      Point2d p = painter->CellToAperture(i, j);
      double r2 = p.x * p.x + p.y * p.y;

      switch (kProfile) {
        case ApertureParameters::ZONE_BINARY: {
          if (r2 >= kBinaryR2) break;
          int zone = static_cast<int>(floor(r2 / kLambdaF));
          mask(i, j) = (zone % 2 == 0) ? 1 : 0;
          break;
        }
        case ApertureParameters::ZONE_SINUSOIDAL:
          if (r2 >= kRadius2) break;
          mask(i, j) = (1 + cos(M_PI * r2 / kLambdaF)) / 2;
          break;
        case ApertureParameters::ZONE_SPIRAL: {
          if (r2 >= kRadius2) break;
          double theta = atan2(p.y, p.x);
          mask(i, j) = cos(M_PI * r2 / kLambdaF + theta) > 0 ? 1 : 0;
          break;
        }
      }
    }
  }
}

}
