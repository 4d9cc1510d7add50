// File Description
// Author: Philip Salvaggio

#include "aperture_geometry.h"

#include <algorithm>
#include <cmath>

using namespace std;

namespace apsim {

namespace {

const double kDefaultSlitLength = 5.0;
const double kDefaultWaveWidth = 10.0;
const double kDefaultCriticalDimension = 1.0;
const double kDefaultDotDiameter = 0.2;
const double kDefaultSmallDotDiameter = 0.1;
const double kDefaultFreeformSize = 10.0;

}

double ApertureDiameter(const ApertureParameters& params) {
  if (params.has_diameter()) return params.diameter();

  switch (params.type()) {
    case ApertureParameters::SLIT:
    case ApertureParameters::CROSS:
    case ApertureParameters::SLIT_ARRAY:
      return kDefaultSlitLength;
    case ApertureParameters::WAVES:
    case ApertureParameters::YIN_YANG:
      return kDefaultWaveWidth;
    case ApertureParameters::LITHO_OPC:
      return kDefaultCriticalDimension;
    case ApertureParameters::MULTI_DOT:
      return kDefaultDotDiameter;
    case ApertureParameters::RANDOM:
    case ApertureParameters::FIBONACCI:
      return kDefaultSmallDotDiameter;
    case ApertureParameters::FREEFORM:
      return kDefaultFreeformSize;
    default:
      return 0;
  }
}

double ApertureInnerDiameter(const ApertureParameters& params) {
  if (params.has_inner_diameter()) return params.inner_diameter();

  switch (params.type()) {
    case ApertureParameters::ANNULAR: return 0.5 * ApertureDiameter(params);
    case ApertureParameters::STAR: return 0.4 * ApertureDiameter(params);
    case ApertureParameters::YIN_YANG: return 0.2;
    default: return 0;
  }
}

double ApertureSlitWidth(const ApertureParameters& params) {
  if (params.has_slit_width()) return params.slit_width();

  switch (params.type()) {
    case ApertureParameters::SLIT: return 0.2;
    case ApertureParameters::CROSS: return 0.5;
    case ApertureParameters::LITHO_OPC: return 0.25 * ApertureDiameter(params);
    default: return 0.1;
  }
}

double ApertureAmplitude(const ApertureParameters& params) {
  if (params.has_slit_height()) return params.slit_height();

  if (params.type() == ApertureParameters::ROSETTE) {
    return 0.3 * ApertureDiameter(params) / 2;
  }
  return 2.0;
}

double ApertureSpread(const ApertureParameters& params) {
  if (params.has_spread()) return params.spread();

  switch (params.type()) {
    case ApertureParameters::SLIT_ARRAY: return 0.5;
    case ApertureParameters::LITHO_OPC: return 1.0;
    case ApertureParameters::MULTI_DOT:
    case ApertureParameters::FIBONACCI: return 2.0;
    case ApertureParameters::RANDOM: return ApertureDiameter(params);
    case ApertureParameters::FRACTAL: return 10.0;
    case ApertureParameters::SIERPINSKI_TRIANGLE: return 5.0;
    default: return 0;
  }
}

int ApertureCount(const ApertureParameters& params) {
  switch (params.type()) {
    case ApertureParameters::SLIT_ARRAY:
      return max(2, params.has_count() ? params.count() : 2);
    case ApertureParameters::MULTI_DOT:
      return max(1, params.has_count() ? params.count() : 8);
    case ApertureParameters::RANDOM:
    case ApertureParameters::FIBONACCI:
      return params.has_count() ? params.count() : 50;
    case ApertureParameters::WAVES:
    case ApertureParameters::YIN_YANG:
      return params.has_count() ? params.count() : 1;
    default:
      return params.count();
  }
}

int ApertureZones(const ApertureParameters& params) {
  if (params.has_zones()) return params.zones();
  return params.type() == ApertureParameters::PHOTON_SIEVE ? 15 : 10;
}

int ApertureUraRank(const ApertureParameters& params) {
  return params.has_ura_rank() ? params.ura_rank() : 13;
}

int ApertureIterations(const ApertureParameters& params) {
  int iterations = params.has_iteration() ? params.iteration() : 3;
  if (params.type() == ApertureParameters::SIERPINSKI_TRIANGLE) {
    return min(6, iterations);
  }
  return min(5, iterations);
}

double ApertureBrushSize(const ApertureParameters& params) {
  return params.has_brush_size() ? params.brush_size() : 0.5;
}

bool IsStrokeShape(ApertureParameters::ApertureType type) {
  switch (type) {
    case ApertureParameters::SLIT:
    case ApertureParameters::CROSS:
    case ApertureParameters::SLIT_ARRAY:
    case ApertureParameters::WAVES:
    case ApertureParameters::YIN_YANG:
    case ApertureParameters::LISSAJOUS:
    case ApertureParameters::SPIRAL:
    case ApertureParameters::ROSETTE:
      return true;
    default:
      return false;
  }
}

double FeatureSize(const ApertureParameters& params) {
  if (IsStrokeShape(params.type())) return ApertureSlitWidth(params);

  switch (params.type()) {
    case ApertureParameters::FREEFORM:
      return ApertureBrushSize(params);
    case ApertureParameters::URA:
      return ApertureDiameter(params) / ApertureUraRank(params);
    default:
      return ApertureDiameter(params);
  }
}

double GeometricExtent(const ApertureParameters& params) {
  const double kDiameter = ApertureDiameter(params);
  const double kWidth = ApertureSlitWidth(params);
  const double kSpread = ApertureSpread(params);

  switch (params.type()) {
    case ApertureParameters::SLIT:
      return max(kDiameter, kWidth);
    case ApertureParameters::SLIT_ARRAY:
      return max(ApertureCount(params) * kSpread + kWidth, kDiameter);
    case ApertureParameters::MULTI_DOT:
    case ApertureParameters::FIBONACCI:
      return 2 * kSpread + kDiameter;
    case ApertureParameters::RANDOM:
      return kSpread + kDiameter;
    case ApertureParameters::FRACTAL:
    case ApertureParameters::SIERPINSKI_TRIANGLE:
      return kSpread;
    case ApertureParameters::LITHO_OPC:
      return max(5 * kDiameter, kDiameter + 2 * (kSpread + kWidth));
    case ApertureParameters::WAVES:
    case ApertureParameters::YIN_YANG:
      return max(kDiameter, ApertureAmplitude(params)) + kWidth;
    case ApertureParameters::ROSETTE:
      return 2 * (kDiameter / 2 + fabs(ApertureAmplitude(params))) + kWidth;
    case ApertureParameters::LISSAJOUS:
    case ApertureParameters::SPIRAL:
      return kDiameter + kWidth;
    case ApertureParameters::FREEFORM:
      return kDiameter + ApertureBrushSize(params);
    default:
      return kDiameter;
  }
}

}
