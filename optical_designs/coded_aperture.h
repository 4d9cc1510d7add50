// Uniformly redundant array built from quadratic residues of a prime rank.
// Author: Philip Salvaggio

#ifndef CODED_APERTURE_H
#define CODED_APERTURE_H

#include <opencv2/core/core.hpp>

#include "aperture.h"

namespace apsim {

class UniformlyRedundantArray : public Aperture {
 public:
  explicit UniformlyRedundantArray(const ApertureParameters& params);

  virtual ~UniformlyRedundantArray();

  // Open/closed pattern of the array. Element (i, j) is row i, column j.
  //
  // Parameters:
  //  rank     Side length of the array, must be prime
  //  pattern  Output: rank x rank array of 0s and 1s
  //
  // Returns:
  //  False if rank is not prime.
  static bool GetPattern(int rank, cv::Mat_<uint8_t>* pattern);

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;
};

}

#endif  // CODED_APERTURE_H
