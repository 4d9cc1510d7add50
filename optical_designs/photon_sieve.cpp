// File Description
// Author: Philip Salvaggio

#include "photon_sieve.h"

#include "base/aperture_geometry.h"
#include "base/lcg_random.h"
#include "base/mask_painter.h"
#include "base/simulation_grid.h"

#include <cmath>

using namespace std;
using namespace cv;

namespace apsim {

namespace {

const double kHoleToZoneWidth = 1.53;

// Arc length between neighboring holes, in hole diameters.
const double kHolePitch = 1.5;

// Holes smaller than this are not drawn. [cells]
const double kMinHoleRadius = 0.2;

}

PhotonSieve::PhotonSieve(const ApertureParameters& params)
    : Aperture(params) {}

PhotonSieve::~PhotonSieve() {}

void PhotonSieve::GetApertureTemplate(const SimulationGrid& grid,
                                      MaskPainter* painter,
                                      Mat_<double>*) const {
  const double kMaxRadius = ApertureDiameter(aperture_params()) / 2;
  const double kLambdaF = grid.wavelength * grid.focal_length;
  const int kZones = ApertureZones(aperture_params());
  if (kMaxRadius <= 0 || kLambdaF <= 0) return;

  LcgRandom random(aperture_params().seed());

  for (int n = 1; n <= 4 * kZones; n++) {
    double zone_center = sqrt((n + 0.5) * kLambdaF);
    if (zone_center > kMaxRadius) break;
    if (n % 2 == 0) continue;

    double zone_width = sqrt((n + 1) * kLambdaF) - sqrt(n * kLambdaF);
    double hole_diameter = kHoleToZoneWidth * zone_width;
    if (hole_diameter / 2 * grid.pixels_per_mm < kMinHoleRadius) continue;

    int num_holes = static_cast<int>(floor(2 * M_PI * zone_center /
                                           (kHolePitch * hole_diameter)));
    for (int k = 0; k < num_holes; k++) {
      double theta = 2 * M_PI * k / num_holes + 0.5 * random.Next();
      painter->FillCircle(Point2d(zone_center * cos(theta),
                                  zone_center * sin(theta)),
                          hole_diameter / 2);
    }
  }
}

}
