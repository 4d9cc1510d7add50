// File Description
// Author: Philip Salvaggio

#include "multi_dot.h"

#include "base/aperture_geometry.h"
#include "base/lcg_random.h"
#include "base/mask_painter.h"

#include <algorithm>
#include <cmath>

using namespace std;
using namespace cv;

namespace apsim {

MultiDot::MultiDot(const ApertureParameters& params) : Aperture(params) {}

MultiDot::~MultiDot() {}

void MultiDot::GetApertureTemplate(const SimulationGrid&,
                                   MaskPainter* painter,
                                   Mat_<double>*) const {
  const int kCount = ApertureCount(aperture_params());
  const double kSpread = ApertureSpread(aperture_params());
  const double kDotR = ApertureDiameter(aperture_params()) / 2;
  if (kDotR <= 0) return;

  if (aperture_params().center_dot()) {
    painter->FillCircle(Point2d(0, 0), kDotR);
  }

  switch (aperture_params().multi_dot_pattern()) {
    case ApertureParameters::DOT_RING:
      for (int i = 0; i < kCount; i++) {
        double theta = 2 * M_PI * i / kCount;
        painter->FillCircle(Point2d(kSpread * cos(theta),
                                    kSpread * sin(theta)), kDotR);
      }
      break;

    case ApertureParameters::DOT_LINE: {
      double step = 2 * kSpread / max(1, kCount - 1);
      for (int i = 0; i < kCount; i++) {
        painter->FillCircle(Point2d(-kSpread + i * step, 0), kDotR);
      }
      break;
    }

    case ApertureParameters::DOT_GRID: {
      int side = static_cast<int>(ceil(sqrt(kCount)));
      double spacing = 2 * kSpread / max(1, side - 1);
      double start = -(side - 1) * spacing / 2;
      int drawn = 0;
      for (int r = 0; r < side && drawn < kCount; r++) {
        for (int c = 0; c < side && drawn < kCount; c++, drawn++) {
          painter->FillCircle(Point2d(start + c * spacing,
                                      start + r * spacing), kDotR);
        }
      }
      break;
    }

    case ApertureParameters::DOT_CONCENTRIC: {
      const int kRings = 5;
      const double kTriangle = kRings * (kRings + 1) / 2.0;
      for (int r = 1; r <= kRings; r++) {
        double radius = kSpread * r / kRings;
        int dots = max(3, static_cast<int>(floor(kCount * r / kTriangle)));

        // Odd rings are offset by half a step.
        double offset = (r % 2) * M_PI / dots;
        for (int k = 0; k < dots; k++) {
          double theta = 2 * M_PI * k / dots + offset;
          painter->FillCircle(Point2d(radius * cos(theta),
                                      radius * sin(theta)), kDotR);
        }
      }
      break;
    }

    case ApertureParameters::DOT_RANDOM: {
      LcgRandom random(aperture_params().seed());
      for (int i = 0; i < kCount; i++) {
        double r = kSpread * sqrt(random.Next());
        double theta = 2 * M_PI * random.Next();
        painter->FillCircle(Point2d(r * cos(theta), r * sin(theta)), kDotR);
      }
      break;
    }
  }
}


RandomDots::RandomDots(const ApertureParameters& params) : Aperture(params) {}

RandomDots::~RandomDots() {}

void RandomDots::GetApertureTemplate(const SimulationGrid&,
                                     MaskPainter* painter,
                                     Mat_<double>*) const {
  const int kCount = ApertureCount(aperture_params());
  const double kCloudR = ApertureSpread(aperture_params()) / 2;
  const double kBaseR = ApertureDiameter(aperture_params()) / 4;
  if (kBaseR <= 0) return;

  LcgRandom random(aperture_params().seed());
  for (int i = 0; i < kCount; i++) {
    double r = kCloudR * sqrt(random.Next());
    double theta = 2 * M_PI * random.Next();
    double dot_r = kBaseR * (0.5 + 1.5 * random.Next());
    painter->FillCircle(Point2d(r * cos(theta), r * sin(theta)), dot_r);
  }
}


FibonacciDots::FibonacciDots(const ApertureParameters& params)
    : Aperture(params) {}

FibonacciDots::~FibonacciDots() {}

void FibonacciDots::GetApertureTemplate(const SimulationGrid&,
                                        MaskPainter* painter,
                                        Mat_<double>*) const {
  const int kCount = ApertureCount(aperture_params());
  const double kMaxR = ApertureSpread(aperture_params());
  const double kDotR = ApertureDiameter(aperture_params()) / 2;
  const double kGoldenAngle = M_PI * (3 - sqrt(5.0));
  if (kDotR <= 0 || kCount <= 0) return;

  for (int i = 0; i < kCount; i++) {
    double r = kMaxR * sqrt(static_cast<double>(i) / kCount);
    double theta = i * kGoldenAngle;
    painter->FillCircle(Point2d(r * cos(theta), r * sin(theta)), kDotR);
  }
}

}
