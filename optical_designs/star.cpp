// File Description
// Author: Philip Salvaggio

#include "star.h"

#include "base/aperture_geometry.h"
#include "base/mask_painter.h"

#include <cmath>
#include <vector>

using namespace std;
using namespace cv;

namespace apsim {

Star::Star(const ApertureParameters& params) : Aperture(params) {}

Star::~Star() {}

void Star::GetApertureTemplate(const SimulationGrid&,
                               MaskPainter* painter,
                               Mat_<double>*) const {
  const int kSpikes = aperture_params().has_spikes() ?
                      aperture_params().spikes() : 5;
  const double kOuterR = ApertureDiameter(aperture_params()) / 2;
  const double kInnerR = ApertureInnerDiameter(aperture_params()) / 2;
  if (kSpikes < 2 || kOuterR <= 0) return;

  // The first spike points along -y.
  double angle = 1.5 * M_PI;
  const double kStep = M_PI / kSpikes;

  vector<Point2d> vertices;
  for (int i = 0; i < kSpikes; i++) {
    vertices.emplace_back(kOuterR * cos(angle), kOuterR * sin(angle));
    angle += kStep;
    vertices.emplace_back(kInnerR * cos(angle), kInnerR * sin(angle));
    angle += kStep;
  }
  painter->FillPolygon(vertices);
}

}
