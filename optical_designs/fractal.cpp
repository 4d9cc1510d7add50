// File Description
// Author: Philip Salvaggio

#include "fractal.h"

#include "base/aperture_geometry.h"
#include "base/mask_painter.h"

#include <cmath>
#include <stack>

using namespace std;
using namespace cv;

namespace apsim {

namespace {

struct CarpetTile {
  Point2d center;
  double size;
  int depth;
};

struct TriangleTile {
  Point2d v1, v2, v3;
  int depth;
};

}

SierpinskiCarpet::SierpinskiCarpet(const ApertureParameters& params)
    : Aperture(params) {}

SierpinskiCarpet::~SierpinskiCarpet() {}

void SierpinskiCarpet::GetApertureTemplate(const SimulationGrid&,
                                           MaskPainter* painter,
                                           Mat_<double>*) const {
  const double kSize = ApertureSpread(aperture_params());
  const int kDepth = ApertureIterations(aperture_params());
  if (kSize <= 0) return;

  // Tiles whose subdivisions would be under half a cell are filled whole.
  const double kMinSubSize = 0.5 / painter->pixels_per_mm();

  stack<CarpetTile> tiles;
  tiles.push(CarpetTile{Point2d(0, 0), kSize, kDepth});
  while (!tiles.empty()) {
    CarpetTile tile = tiles.top();
    tiles.pop();

    double sub_size = tile.size / 3;
    if (tile.depth <= 0 || sub_size < kMinSubSize) {
      painter->FillRect(tile.center, tile.size, tile.size);
      continue;
    }

    for (int dx = -1; dx <= 1; dx++) {
      for (int dy = -1; dy <= 1; dy++) {
        if (dx == 0 && dy == 0) continue;
        tiles.push(CarpetTile{tile.center + Point2d(dx, dy) * sub_size,
                              sub_size, tile.depth - 1});
      }
    }
  }
}


SierpinskiTriangle::SierpinskiTriangle(const ApertureParameters& params)
    : Aperture(params) {}

SierpinskiTriangle::~SierpinskiTriangle() {}

void SierpinskiTriangle::GetApertureTemplate(const SimulationGrid&,
                                             MaskPainter* painter,
                                             Mat_<double>*) const {
  const double kSide = ApertureSpread(aperture_params());
  const int kDepth = ApertureIterations(aperture_params());
  if (kSide <= 0) return;

  const double kMinEdge = 1 / painter->pixels_per_mm();

  // Equilateral triangle centered on the axis, pointing along -y.
  const double kCircumR = kSide / sqrt(3.0);
  stack<TriangleTile> tiles;
  tiles.push(TriangleTile{Point2d(0, -kCircumR),
                          Point2d(kSide / 2, kCircumR / 2),
                          Point2d(-kSide / 2, kCircumR / 2), kDepth});

  while (!tiles.empty()) {
    TriangleTile tile = tiles.top();
    tiles.pop();

    if (tile.depth <= 0 || norm(tile.v1 - tile.v2) < kMinEdge) {
      painter->FillPolygon({tile.v1, tile.v2, tile.v3});
      continue;
    }

    Point2d m12 = (tile.v1 + tile.v2) * 0.5;
    Point2d m23 = (tile.v2 + tile.v3) * 0.5;
    Point2d m31 = (tile.v3 + tile.v1) * 0.5;
    tiles.push(TriangleTile{tile.v1, m12, m31, tile.depth - 1});
    tiles.push(TriangleTile{m12, tile.v2, m23, tile.depth - 1});
    tiles.push(TriangleTile{m31, m23, tile.v3, tile.depth - 1});
  }
}

}
