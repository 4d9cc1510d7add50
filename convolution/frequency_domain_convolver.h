// Convolution by multiplication of spectra. The cost does not depend on how
// many kernel samples are non-zero.
// Author: Philip Salvaggio

#ifndef FREQUENCY_DOMAIN_CONVOLVER_H
#define FREQUENCY_DOMAIN_CONVOLVER_H

#include "convolution/convolver.h"

namespace apsim {

class FrequencyDomainConvolver : public Convolver {
 public:
  FrequencyDomainConvolver();
  virtual ~FrequencyDomainConvolver();

  bool Convolve(const cv::Mat_<double>& channel,
                const cv::Mat_<double>& kernel,
                SimulationOptions::EdgeMode edge_mode,
                cv::Mat_<double>* output) const override;

  std::string name() const override { return "frequency domain"; }

  // Number of floating point operations the convolution of a rows x cols
  // channel with a kernel_size square kernel takes, roughly.
  static double EstimateCost(int rows, int cols, int kernel_size);
};

}

#endif  // FREQUENCY_DOMAIN_CONVOLVER_H
