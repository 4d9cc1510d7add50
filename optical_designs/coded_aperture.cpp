// File Description
// Author: Philip Salvaggio

#include "coded_aperture.h"

#include "base/aperture_geometry.h"
#include "base/mask_painter.h"
#include "base/math_utils.h"
#include "io/logging.h"

#include <iostream>
#include <vector>

using namespace std;
using namespace cv;

namespace apsim {

UniformlyRedundantArray::UniformlyRedundantArray(
    const ApertureParameters& params) : Aperture(params) {}

UniformlyRedundantArray::~UniformlyRedundantArray() {}

bool UniformlyRedundantArray::GetPattern(int rank, Mat_<uint8_t>* pattern) {
  if (!pattern || !IsPrime(rank)) return false;

  const vector<bool> kResidues = QuadraticResidues(rank);

  pattern->create(rank, rank);
  for (int i = 0; i < rank; i++) {
    for (int j = 0; j < rank; j++) {
      if (i == 0) {
        (*pattern)(i, j) = 0;
      } else if (j == 0) {
        (*pattern)(i, j) = 1;
      } else {
        // Both residues, or both non-residues.
        (*pattern)(i, j) = (kResidues[i] == kResidues[j]) ? 1 : 0;
      }
    }
  }
  return true;
}

void UniformlyRedundantArray::GetApertureTemplate(const SimulationGrid&,
                                                  MaskPainter* painter,
                                                  Mat_<double>*) const {
  const int kRank = ApertureUraRank(aperture_params());
  const double kDiameter = ApertureDiameter(aperture_params());
  if (kDiameter <= 0) return;

  Mat_<uint8_t> pattern;
  if (!GetPattern(kRank, &pattern)) {
    mainLog() << "Warning: URA rank " << kRank << " is not prime." << endl;
    return;
  }

  const double kCell = kDiameter / kRank;
  const double kOffset = kDiameter / 2;
  for (int i = 0; i < kRank; i++) {
    for (int j = 0; j < kRank; j++) {
      if (!pattern(i, j)) continue;

      // Cells are drawn exactly, neighbors must join without gaps.
      double x0 = j * kCell - kOffset;
      double y0 = i * kCell - kOffset;
      painter->FillPolygon({Point2d(x0, y0), Point2d(x0 + kCell, y0),
                            Point2d(x0 + kCell, y0 + kCell),
                            Point2d(x0, y0 + kCell)});
    }
  }
}

}
