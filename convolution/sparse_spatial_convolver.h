// Direct convolution that only visits the significant kernel samples. Cheap
// for compact kernels, such as pinholes that are close to the geometric limit.
// Author: Philip Salvaggio

#ifndef SPARSE_SPATIAL_CONVOLVER_H
#define SPARSE_SPATIAL_CONVOLVER_H

#include "convolution/convolver.h"

#include <vector>

namespace apsim {

class SparseSpatialConvolver : public Convolver {
 public:
  struct Tap {
    int dx;
    int dy;
    double weight;
  };

  // Parameters:
  //  threshold    Kernel samples at or below this weight are dropped
  //  parallelism  Process the output rows with TBB
  SparseSpatialConvolver(double threshold, bool parallelism);
  virtual ~SparseSpatialConvolver();

  bool Convolve(const cv::Mat_<double>& channel,
                const cv::Mat_<double>& kernel,
                SimulationOptions::EdgeMode edge_mode,
                cv::Mat_<double>* output) const override;

  std::string name() const override { return "sparse spatial"; }

  // Extract the taps of a kernel. The kept weights are rescaled so that they
  // have the same sum as the whole kernel.
  static void ExtractTaps(const cv::Mat_<double>& kernel, double threshold,
                          std::vector<Tap>* taps);

  // Rough operation count of convolving with the given number of taps.
  static double EstimateCost(int rows, int cols, size_t num_taps);

 private:
  double threshold_;
  bool parallelism_;
};

}

#endif  // SPARSE_SPATIAL_CONVOLVER_H
