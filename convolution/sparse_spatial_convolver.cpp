// File Description
// Author: Philip Salvaggio

#include "sparse_spatial_convolver.h"

#include "io/logging.h"

#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>

#include <algorithm>
#include <iostream>

using namespace std;
using namespace cv;

namespace apsim {

SparseSpatialConvolver::SparseSpatialConvolver(double threshold,
                                               bool parallelism)
    : threshold_(threshold), parallelism_(parallelism) {}

SparseSpatialConvolver::~SparseSpatialConvolver() {}

void SparseSpatialConvolver::ExtractTaps(const Mat_<double>& kernel,
                                         double threshold,
                                         vector<Tap>* taps) {
  taps->clear();

  const int kHalfRows = kernel.rows / 2;
  const int kHalfCols = kernel.cols / 2;

  double total = 0, kept = 0;
  for (int i = 0; i < kernel.rows; i++) {
    for (int j = 0; j < kernel.cols; j++) {
      double weight = kernel(i, j);
      total += weight;
      if (weight > threshold) {
        taps->push_back(Tap{j - kHalfCols, i - kHalfRows, weight});
        kept += weight;
      }
    }
  }

  if (kept > 0) {
    for (Tap& tap : *taps) tap.weight *= total / kept;
  }
}

double SparseSpatialConvolver::EstimateCost(int rows, int cols,
                                            size_t num_taps) {
  return 2.0 * rows * cols * num_taps;
}

bool SparseSpatialConvolver::Convolve(const Mat_<double>& channel,
                                      const Mat_<double>& kernel,
                                      SimulationOptions::EdgeMode edge_mode,
                                      Mat_<double>* output) const {
  if (!output || channel.empty() || kernel.empty() ||
      kernel.rows % 2 == 0 || kernel.cols % 2 == 0) {
    mainLog() << "Error: Invalid input to the sparse spatial convolver."
              << endl;
    return false;
  }

  vector<Tap> taps;
  ExtractTaps(kernel, threshold_, &taps);

  const int kRows = channel.rows;
  const int kCols = channel.cols;
  const bool kClamp = (edge_mode == SimulationOptions::CLAMP);

  Mat_<double> result = Mat_<double>::zeros(kRows, kCols);

  auto convolve_rows = [&](const tbb::blocked_range<int>& range) {
    for (int r = range.begin(); r != range.end(); r++) {
      double* out_row = result[r];
      for (const Tap& tap : taps) {
        int src_r = r - tap.dy;
        if (src_r < 0 || src_r >= kRows) {
          if (!kClamp) continue;
          src_r = std::min(std::max(src_r, 0), kRows - 1);
        }
        const double* src_row = channel[src_r];

        for (int c = 0; c < kCols; c++) {
          int src_c = c - tap.dx;
          if (src_c < 0 || src_c >= kCols) {
            if (!kClamp) continue;
            src_c = std::min(std::max(src_c, 0), kCols - 1);
          }
          out_row[c] += tap.weight * src_row[src_c];
        }
      }
    }
  };

  tbb::blocked_range<int> rows(0, kRows);
  if (parallelism_) {
    tbb::parallel_for(rows, convolve_rows);
  } else {
    convolve_rows(rows);
  }

  *output = result;
  return true;
}

}
