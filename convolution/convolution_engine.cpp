// File Description
// Author: Philip Salvaggio

#include "convolution_engine.h"

#include "convolution/frequency_domain_convolver.h"
#include "convolution/sparse_spatial_convolver.h"
#include "io/logging.h"

#include <iostream>

using namespace std;
using namespace cv;

namespace apsim {

constexpr double ConvolutionEngine::kMaxOutputValue;

ConvolutionEngine::ConvolutionEngine(const SimulationOptions& options)
    : options_(options) {}

ConvolutionEngine::~ConvolutionEngine() {}

unique_ptr<Convolver> ConvolutionEngine::SelectConvolver(
    int rows, int cols, const Mat_<double>& kernel) const {
  const double kThreshold = options_.sparse_threshold();

  switch (options_.convolution_strategy()) {
    case SimulationOptions::FREQUENCY_DOMAIN:
      return unique_ptr<Convolver>(new FrequencyDomainConvolver());
    case SimulationOptions::SPARSE_SPATIAL:
      return unique_ptr<Convolver>(
          new SparseSpatialConvolver(kThreshold, options_.parallelism()));
    case SimulationOptions::AUTO:
      break;
  }

  vector<SparseSpatialConvolver::Tap> taps;
  SparseSpatialConvolver::ExtractTaps(kernel, kThreshold, &taps);

  double sparse_cost = SparseSpatialConvolver::EstimateCost(rows, cols,
                                                            taps.size());
  double fft_cost = FrequencyDomainConvolver::EstimateCost(rows, cols,
                                                           kernel.rows);
  if (sparse_cost < fft_cost) {
    return unique_ptr<Convolver>(
        new SparseSpatialConvolver(kThreshold, options_.parallelism()));
  }
  return unique_ptr<Convolver>(new FrequencyDomainConvolver());
}

bool ConvolutionEngine::Convolve(const Mat& source,
                                 const vector<Mat_<double>>& kernels,
                                 double exposure,
                                 Mat* output) const {
  if (!output || source.empty() || source.type() != CV_64FC4) {
    mainLog() << "Error: Convolution source must be a CV_64FC4 image."
              << endl;
    return false;
  }
  if (kernels.size() != 1 && kernels.size() != 3) {
    mainLog() << "Error: Expected 1 or 3 kernels, got " << kernels.size()
              << "." << endl;
    return false;
  }

  vector<Mat> channels;
  split(source, channels);

  for (int c = 0; c < 3; c++) {
    const Mat_<double>& kernel = kernels[kernels.size() == 1 ? 0 : c];

    unique_ptr<Convolver> convolver =
        SelectConvolver(source.rows, source.cols, kernel);
    if (c == 0 || kernels.size() > 1) {
      mainLog() << "Convolving " << source.cols << " x " << source.rows
                << " image with a " << kernel.cols << " x " << kernel.rows
                << " kernel (" << convolver->name() << ")." << endl;
    }

    Mat_<double> blurred;
    if (!convolver->Convolve(channels[c], kernel, options_.edge_mode(),
                             &blurred)) {
      return false;
    }

    blurred *= exposure;
    if (!checkRange(blurred)) {
      mainLog() << "Error: Convolution produced non-finite values." << endl;
      return false;
    }

    Mat_<double> clamped = cv::max(blurred, 0.0);
    channels[c] = cv::min(clamped, kMaxOutputValue);
  }
  channels[3] = Mat::ones(source.size(), CV_64F);

  merge(channels, *output);
  return true;
}

}
