// File Description
// Author: Philip Salvaggio

#include "circular.h"

#include "base/aperture_geometry.h"
#include "base/mask_painter.h"
#include "base/simulation_grid.h"

#include <algorithm>
#include <cmath>

using namespace std;
using namespace cv;

namespace apsim {

Circular::Circular(const ApertureParameters& params) : Aperture(params) {}

Circular::~Circular() {}

void Circular::GetApertureTemplate(const SimulationGrid& grid,
                                   MaskPainter*,
                                   Mat_<double>* output) const {
  Mat_<double>& mask = *output;

  const double kDiameter = ApertureDiameter(aperture_params());
  if (kDiameter <= 0) return;

  const int kSize = mask.rows;
  const double kHalfSize = kSize / 2.0;
  const double kRadius = max(MaskPainter::kMinFeatureCells,
                             kDiameter / 2 * grid.pixels_per_mm);
  const double kRadius2 = kRadius * kRadius;

  for (int i = 0; i < kSize; i++) {
    double y = i - kHalfSize;
    for (int j = 0; j < kSize; j++) {
      double x = j - kHalfSize;

      double r2 = x*x + y*y;
      mask(i, j) = (r2 < kRadius2) ? 1 : 0;
    }
  }
}


Annular::Annular(const ApertureParameters& params) : Aperture(params) {}

Annular::~Annular() {}

void Annular::GetApertureTemplate(const SimulationGrid& grid,
                                  MaskPainter*,
                                  Mat_<double>* output) const {
  Mat_<double>& mask = *output;

  const double kDiameter = ApertureDiameter(aperture_params());
  const double kInnerDiameter = ApertureInnerDiameter(aperture_params());
  if (kDiameter <= 0) return;

  const int kSize = mask.rows;
  const double kHalfSize = kSize / 2.0;
  const double kOuterR = max(MaskPainter::kMinFeatureCells,
                             kDiameter / 2 * grid.pixels_per_mm);
  const double kInnerR = max(0.0, kInnerDiameter / 2 * grid.pixels_per_mm);
  const double kOuterR2 = kOuterR * kOuterR;
  const double kInnerR2 = kInnerR * kInnerR;

  for (int i = 0; i < kSize; i++) {
    double y = i - kHalfSize;
    for (int j = 0; j < kSize; j++) {
      double x = j - kHalfSize;

      double r2 = x*x + y*y;
      mask(i, j) = (r2 < kOuterR2 && r2 >= kInnerR2) ? 1 : 0;
    }
  }
}

}
