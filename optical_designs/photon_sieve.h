// A photon sieve replaces the open zones of a zone plate with rings of
// pinholes. Holes are 1.53 times wider than the zone they sit on, which puts
// light from beyond the zone edges into the focus as well.
// Author: Philip Salvaggio

#ifndef PHOTON_SIEVE_H
#define PHOTON_SIEVE_H

#include <opencv2/core/core.hpp>

#include "aperture.h"

namespace apsim {

class PhotonSieve : public Aperture {
 public:
  explicit PhotonSieve(const ApertureParameters& params);

  virtual ~PhotonSieve();

 // Virtual functions from Aperture
 private:
  void GetApertureTemplate(const SimulationGrid& grid,
                           MaskPainter* painter,
                           cv::Mat_<double>* output) const override;
};

}

#endif  // PHOTON_SIEVE_H
