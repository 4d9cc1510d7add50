// Blurs every color channel of an image with the PSF of its wavelength.
// Author: Philip Salvaggio

#ifndef CONVOLUTION_ENGINE_H
#define CONVOLUTION_ENGINE_H

#include "base/simulation_config.pb.h"
#include "convolution/convolver.h"

#include <opencv2/core/core.hpp>

#include <memory>
#include <vector>

namespace apsim {

class ConvolutionEngine {
 public:
  // Upper bound of the linear output. Matches the range of a half float
  // accumulation target.
  static constexpr double kMaxOutputValue = 65504;

  explicit ConvolutionEngine(const SimulationOptions& options);
  ~ConvolutionEngine();

  // Convolve an image.
  //
  // Parameters:
  //  source    CV_64FC4 RGBA image in linear units
  //  kernels   One kernel shared by all color channels, or one each for red,
  //            green and blue
  //  exposure  Scale applied after the convolution
  //  output    Output: CV_64FC4 image, colors clamped to
  //            [0, kMaxOutputValue] and alpha set to 1
  //
  // Returns:
  //  False on invalid input or if the result is not finite.
  bool Convolve(const cv::Mat& source,
                const std::vector<cv::Mat_<double>>& kernels,
                double exposure,
                cv::Mat* output) const;

  // Pick the convolution strategy for a channel and kernel, following
  // options().convolution_strategy(). AUTO compares the estimated costs.
  std::unique_ptr<Convolver> SelectConvolver(
      int rows, int cols, const cv::Mat_<double>& kernel) const;

  const SimulationOptions& options() const { return options_; }

 private:
  SimulationOptions options_;
};

}

#endif  // CONVOLUTION_ENGINE_H
