// File Description
// Author: Philip Salvaggio

#include "parametric_curve.h"

#include "base/aperture_geometry.h"
#include "base/mask_painter.h"
#include "base/math_utils.h"

#include <algorithm>
#include <cmath>
#include <vector>

using namespace std;
using namespace cv;

namespace apsim {

Waves::Waves(const ApertureParameters& params) : Aperture(params) {}

Waves::~Waves() {}

void Waves::GetApertureTemplate(const SimulationGrid&,
                                MaskPainter* painter,
                                Mat_<double>*) const {
  const double kWidth = ApertureDiameter(aperture_params());
  const double kThickness = ApertureSlitWidth(aperture_params());
  const double kAmplitude = ApertureAmplitude(aperture_params()) / 2;
  const int kWaves = ApertureCount(aperture_params());
  if (kWidth <= 0 || kThickness <= 0 || kWaves <= 0) return;

  const int kSteps = 100 * kWaves;
  vector<Point2d> points;
  points.reserve(kSteps + 1);
  for (int i = 0; i <= kSteps; i++) {
    double t = static_cast<double>(i) / kSteps;
    points.emplace_back((t - 0.5) * kWidth,
                        kAmplitude * sin(2 * M_PI * kWaves * t));
  }
  painter->Stroke(points, kThickness);

  if (aperture_params().type() != ApertureParameters::YIN_YANG) return;

  const double kDotR = ApertureInnerDiameter(aperture_params()) / 2;
  if (kDotR <= 0) return;
  for (int w = 0; w < kWaves; w++) {
    double peak = (w + 0.25) / kWaves;
    double trough = (w + 0.75) / kWaves;
    painter->FillCircle(Point2d((peak - 0.5) * kWidth, 0), kDotR);
    painter->FillCircle(Point2d((trough - 0.5) * kWidth, 0), kDotR);
  }
}


Lissajous::Lissajous(const ApertureParameters& params) : Aperture(params) {}

Lissajous::~Lissajous() {}

void Lissajous::GetApertureTemplate(const SimulationGrid&,
                                    MaskPainter* painter,
                                    Mat_<double>*) const {
  const ApertureParameters& params = aperture_params();
  const double kRx = params.has_lissajous_rx() ? params.lissajous_rx() : 3;
  const double kRy = params.has_lissajous_ry() ? params.lissajous_ry() : 2;
  const double kDelta = DegreesToRadians(params.lissajous_delta());
  const double kRadius = ApertureDiameter(params) / 2;
  const double kThickness = ApertureSlitWidth(params);
  if (kRadius <= 0 || kThickness <= 0) return;

  const int kSteps = 500;
  vector<Point2d> points;
  points.reserve(kSteps + 1);
  for (int i = 0; i <= kSteps; i++) {
    double t = 2 * M_PI * i / kSteps;
    points.emplace_back(kRadius * sin(kRx * t + kDelta),
                        kRadius * sin(kRy * t));
  }
  painter->Stroke(points, kThickness);
}


Spiral::Spiral(const ApertureParameters& params) : Aperture(params) {}

Spiral::~Spiral() {}

void Spiral::GetApertureTemplate(const SimulationGrid&,
                                 MaskPainter* painter,
                                 Mat_<double>*) const {
  const ApertureParameters& params = aperture_params();
  const int kArms = max(1, params.has_spiral_arms() ? params.spiral_arms() : 1);
  const double kTurns = params.has_spiral_turns() ? params.spiral_turns() : 3;
  const double kMaxR = ApertureDiameter(params) / 2;
  const double kThickness = ApertureSlitWidth(params);
  if (kMaxR <= 0 || kThickness <= 0 || kTurns <= 0) return;

  const int kSteps = max(1, static_cast<int>(ceil(100 * kTurns)));
  for (int a = 0; a < kArms; a++) {
    double start_angle = 2 * M_PI * a / kArms;

    vector<Point2d> points;
    points.reserve(kSteps + 1);
    for (int i = 0; i <= kSteps; i++) {
      double t = static_cast<double>(i) / kSteps;
      double r = t * kMaxR;
      double theta = start_angle + 2 * M_PI * kTurns * t;
      points.emplace_back(r * cos(theta), r * sin(theta));
    }
    painter->Stroke(points, kThickness);
  }
}


Rosette::Rosette(const ApertureParameters& params) : Aperture(params) {}

Rosette::~Rosette() {}

void Rosette::GetApertureTemplate(const SimulationGrid&,
                                  MaskPainter* painter,
                                  Mat_<double>*) const {
  const ApertureParameters& params = aperture_params();
  const int kPetals = params.has_rosette_petals() ? params.rosette_petals() : 5;
  const double kBaseR = ApertureDiameter(params) / 2;
  const double kAmplitude = ApertureAmplitude(params);
  const double kThickness = ApertureSlitWidth(params);
  if (kBaseR <= 0 || kThickness <= 0) return;

  const int kSteps = 360;
  vector<Point2d> points;
  points.reserve(kSteps);
  for (int i = 0; i < kSteps; i++) {
    double theta = 2 * M_PI * i / kSteps;
    double r = kBaseR + kAmplitude * cos(kPetals * theta);
    points.emplace_back(r * cos(theta), r * sin(theta));
  }
  painter->Stroke(points, kThickness, true);
}


Freeform::Freeform(const ApertureParameters& params) : Aperture(params) {}

Freeform::~Freeform() {}

void Freeform::GetApertureTemplate(const SimulationGrid&,
                                   MaskPainter* painter,
                                   Mat_<double>*) const {
  const ApertureParameters& params = aperture_params();
  const double kScale = ApertureDiameter(params) / 2;
  const double kBrush = ApertureBrushSize(params);
  if (kScale <= 0 || kBrush <= 0) return;

  vector<Point2d> stroke;
  for (const PathPoint& point : params.path()) {
    if (point.pen_up()) {
      painter->Stroke(stroke, kBrush);
      stroke.clear();
      continue;
    }
    stroke.emplace_back(point.x() * kScale, point.y() * kScale);
  }
  painter->Stroke(stroke, kBrush);
}

}
