// Angular spectrum propagation. The field's spectrum is multiplied by the
// free-space transfer function exp(i k z sqrt(1 - (lambda fx)^2 -
// (lambda fy)^2)). Spatial frequencies beyond 1 / lambda are evanescent and
// decay as exp(-k z sqrt((lambda fx)^2 + (lambda fy)^2 - 1)).
// Author: Philip Salvaggio

#ifndef ANGULAR_SPECTRUM_PROPAGATOR_H
#define ANGULAR_SPECTRUM_PROPAGATOR_H

#include "propagation/propagator.h"

#include <opencv2/core/core.hpp>

namespace apsim {

class AngularSpectrumPropagator : public Propagator {
 public:
  AngularSpectrumPropagator();
  virtual ~AngularSpectrumPropagator();

  bool Propagate(const SimulationGrid& grid,
                 double distance,
                 ComplexField* field) const override;

  // Transfer function in the unshifted FFT layout.
  static void GetTransferFunction(const SimulationGrid& grid,
                                  double distance,
                                  cv::Mat_<double>* real,
                                  cv::Mat_<double>* imag);
};

}

#endif  // ANGULAR_SPECTRUM_PROPAGATOR_H
