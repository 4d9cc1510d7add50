// Interface for free-space propagation of a complex field.
// Author: Philip Salvaggio

#ifndef PROPAGATOR_H
#define PROPAGATOR_H

namespace apsim {

class ComplexField;
struct SimulationGrid;

class Propagator {
 public:
  virtual ~Propagator() {}

  // Propagate a field in place.
  //
  // Parameters:
  //  grid      Sampling of the field, including its wavelength
  //  distance  Propagation distance [mm]
  //  field     Input/Output: the field
  //
  // Returns:
  //  False if the field could not be propagated.
  virtual bool Propagate(const SimulationGrid& grid,
                         double distance,
                         ComplexField* field) const = 0;
};

}

#endif  // PROPAGATOR_H
