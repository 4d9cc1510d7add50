// File Description
// Author: Philip Salvaggio

#include "frequency_domain_convolver.h"

#include "io/logging.h"

#include <opencv2/core/core.hpp>
#include <opencv2/imgproc/imgproc.hpp>

#include <cmath>
#include <iostream>

using namespace std;
using namespace cv;

namespace apsim {

FrequencyDomainConvolver::FrequencyDomainConvolver() {}

FrequencyDomainConvolver::~FrequencyDomainConvolver() {}

bool FrequencyDomainConvolver::Convolve(const Mat_<double>& channel,
                                        const Mat_<double>& kernel,
                                        SimulationOptions::EdgeMode edge_mode,
                                        Mat_<double>* output) const {
  if (!output || channel.empty() || kernel.empty() ||
      kernel.rows % 2 == 0 || kernel.cols % 2 == 0) {
    mainLog() << "Error: Invalid input to the frequency domain convolver."
              << endl;
    return false;
  }

  const int kHalfRows = kernel.rows / 2;
  const int kHalfCols = kernel.cols / 2;

  Mat_<double> padded;
  copyMakeBorder(channel, padded, kHalfRows, kHalfRows, kHalfCols, kHalfCols,
                 edge_mode == SimulationOptions::CLAMP ? BORDER_REPLICATE
                                                       : BORDER_CONSTANT,
                 Scalar(0));

  // Zero pad both to a size that holds the full linear convolution.
  Size dft_size(getOptimalDFTSize(padded.cols + kernel.cols - 1),
                getOptimalDFTSize(padded.rows + kernel.rows - 1));

  Mat_<double> image_buffer = Mat_<double>::zeros(dft_size);
  Mat_<double> kernel_buffer = Mat_<double>::zeros(dft_size);
  padded.copyTo(image_buffer(Rect(0, 0, padded.cols, padded.rows)));
  kernel.copyTo(kernel_buffer(Rect(0, 0, kernel.cols, kernel.rows)));

  Mat image_fft, kernel_fft, product_fft;
  dft(image_buffer, image_fft, 0, padded.rows);
  dft(kernel_buffer, kernel_fft, 0, kernel.rows);
  mulSpectrums(image_fft, kernel_fft, product_fft, 0);

  Mat product;
  dft(product_fft, product, DFT_INVERSE | DFT_SCALE | DFT_REAL_OUTPUT);

  // Output pixel (r, c) of the centered convolution is sample (r + 2 * half,
  // c + 2 * half) of the full convolution of the padded channel.
  product(Rect(2 * kHalfCols, 2 * kHalfRows, channel.cols, channel.rows))
      .copyTo(*output);
  return true;
}

double FrequencyDomainConvolver::EstimateCost(int rows, int cols,
                                              int kernel_size) {
  double height = getOptimalDFTSize(rows + 2 * kernel_size);
  double width = getOptimalDFTSize(cols + 2 * kernel_size);
  double n = height * width;

  // Three transforms and the spectrum product.
  return 3 * 5 * n * log2(n) + 6 * n;
}

}
