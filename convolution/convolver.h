// Interface for convolving an image channel with a point spread function.
// Author: Philip Salvaggio

#ifndef CONVOLVER_H
#define CONVOLVER_H

#include "base/simulation_config.pb.h"

#include <opencv2/core/core.hpp>

#include <string>

namespace apsim {

class Convolver {
 public:
  virtual ~Convolver() {}

  // Convolve a channel with a kernel.
  //
  // Parameters:
  //  channel    The input channel
  //  kernel     Square kernel with an odd side length, centered at
  //             (rows / 2, cols / 2)
  //  edge_mode  How samples beyond the channel border are treated
  //  output     Output: the convolved channel, same size as the input
  virtual bool Convolve(const cv::Mat_<double>& channel,
                        const cv::Mat_<double>& kernel,
                        SimulationOptions::EdgeMode edge_mode,
                        cv::Mat_<double>* output) const = 0;

  virtual std::string name() const = 0;
};

}

#endif  // CONVOLVER_H
