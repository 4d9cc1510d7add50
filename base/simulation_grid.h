// Sampling of the aperture plane for one wavelength.
// Author: Philip Salvaggio

#ifndef SIMULATION_GRID_H
#define SIMULATION_GRID_H

#include "base/aperture_parameters.pb.h"

#include <string>

namespace apsim {

struct SimulationGrid {
  static constexpr int kMinSize = 256;
  static constexpr int kMaxSize = 2048;

  // Ratio of the diffractive window to the diffraction angle of the smallest
  // feature, lambda * f / feature.
  static constexpr double kDiffractiveWindowFactor = 40;
  static constexpr double kGeometricWindowFactor = 1.5;

  int size = 0;                      // Side length in cells, a power of two
  double window = 0;                 // Physical side length [mm]
  double pixels_per_mm = 0;          // size / window
  double feature_size = 0;           // [mm]
  double diffractive_window = 0;     // [mm]
  double geometric_window = 0;       // [mm]
  double wavelength = 0;             // [mm]
  double focal_length = 0;           // [mm]

  double mm_per_pixel() const { return window / size; }

  // Index of the cell at the optical axis.
  int center() const { return size / 2; }
};

// Size the simulation grid for an aperture.
//
// Parameters:
//  aperture        The aperture descriptor
//  wavelength      Wavelength of the simulation [nm]
//  focal_length    Aperture to sensor distance [mm]
//  target_density  Requested sampling of the window [pixels/mm]
//  grid            Output: the grid
//
// Returns:
//  False if the window or the density is not finite and positive, which
//  happens when a required dimension of the aperture is zero.
bool ComputeSimulationGrid(const ApertureParameters& aperture,
                           double wavelength,
                           double focal_length,
                           double target_density,
                           SimulationGrid* grid);

std::string PrintGrid(const SimulationGrid& grid);

}

#endif  // SIMULATION_GRID_H
