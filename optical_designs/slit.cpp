// File Description
// Author: Philip Salvaggio

#include "slit.h"

#include "base/aperture_geometry.h"
#include "base/mask_painter.h"

using namespace cv;

namespace apsim {

Slit::Slit(const ApertureParameters& params) : Aperture(params) {}

Slit::~Slit() {}

void Slit::GetApertureTemplate(const SimulationGrid&,
                               MaskPainter* painter,
                               Mat_<double>*) const {
  const double kLength = ApertureDiameter(aperture_params());
  const double kWidth = ApertureSlitWidth(aperture_params());
  if (kLength <= 0 || kWidth <= 0) return;

  painter->FillRect(Point2d(0, 0), kLength, kWidth);
}


Cross::Cross(const ApertureParameters& params) : Aperture(params) {}

Cross::~Cross() {}

void Cross::GetApertureTemplate(const SimulationGrid&,
                                MaskPainter* painter,
                                Mat_<double>*) const {
  const double kLength = ApertureDiameter(aperture_params());
  const double kWidth = ApertureSlitWidth(aperture_params());
  if (kLength <= 0 || kWidth <= 0) return;

  painter->FillRect(Point2d(0, 0), kWidth, kLength);
  painter->FillRect(Point2d(0, 0), kLength, kWidth);
}


SlitArray::SlitArray(const ApertureParameters& params) : Aperture(params) {}

SlitArray::~SlitArray() {}

void SlitArray::GetApertureTemplate(const SimulationGrid&,
                                    MaskPainter* painter,
                                    Mat_<double>*) const {
  const int kCount = ApertureCount(aperture_params());
  const double kHeight = ApertureDiameter(aperture_params());
  const double kWidth = ApertureSlitWidth(aperture_params());
  const double kSpacing = ApertureSpread(aperture_params());
  if (kHeight <= 0 || kWidth <= 0) return;

  const double kStartX = -(kCount - 1) * kSpacing / 2;
  for (int i = 0; i < kCount; i++) {
    painter->FillRect(Point2d(kStartX + i * kSpacing, 0), kWidth, kHeight);
  }
}


LithoOpc::LithoOpc(const ApertureParameters& params) : Aperture(params) {}

LithoOpc::~LithoOpc() {}

void LithoOpc::GetApertureTemplate(const SimulationGrid&,
                                   MaskPainter* painter,
                                   Mat_<double>*) const {
  const double kCriticalDim = ApertureDiameter(aperture_params());
  const double kAssistWidth = ApertureSlitWidth(aperture_params());
  const double kGap = ApertureSpread(aperture_params());
  if (kCriticalDim <= 0) return;

  const double kHeight = 5 * kCriticalDim;
  painter->FillRect(Point2d(0, 0), kCriticalDim, kHeight);

  if (kAssistWidth <= 0) return;
  double offset = kCriticalDim / 2 + kGap + kAssistWidth / 2;
  painter->FillRect(Point2d(-offset, 0), kAssistWidth, kHeight);
  painter->FillRect(Point2d(offset, 0), kAssistWidth, kHeight);
}

}
