// File Description
// Author: Philip Salvaggio

#include "simulation_grid.h"

#include "base/aperture_geometry.h"
#include "io/logging.h"

#include <algorithm>
#include <cmath>
#include <sstream>

using namespace std;

namespace apsim {

constexpr int SimulationGrid::kMinSize;
constexpr int SimulationGrid::kMaxSize;
constexpr double SimulationGrid::kDiffractiveWindowFactor;
constexpr double SimulationGrid::kGeometricWindowFactor;

bool ComputeSimulationGrid(const ApertureParameters& aperture,
                           double wavelength,
                           double focal_length,
                           double target_density,
                           SimulationGrid* grid) {
  if (!grid) return false;

  if (!std::isfinite(target_density) || target_density <= 0) {
    mainLog() << "Error: Invalid pixel density " << target_density
              << " [pixels/mm]." << endl;
    return false;
  }

  if (!std::isfinite(wavelength) || wavelength <= 0 ||
      !std::isfinite(focal_length) || focal_length <= 0) {
    mainLog() << "Error: Invalid wavelength " << wavelength
              << " [nm] or focal length " << focal_length << " [mm]." << endl;
    return false;
  }

  const double kLambda = wavelength * 1e-6;
  const double kFeature = FeatureSize(aperture);

  double diffractive = SimulationGrid::kDiffractiveWindowFactor * kLambda *
                       focal_length / kFeature;
  double geometric = SimulationGrid::kGeometricWindowFactor *
                     GeometricExtent(aperture);
  double window = max(geometric, diffractive);

  if (!std::isfinite(window) || window <= 0 || kFeature <= 0) {
    mainLog() << "Error: Could not size the simulation grid for a "
              << ApertureParameters::ApertureType_Name(aperture.type())
              << " aperture with feature size " << kFeature << " [mm]."
              << endl;
    return false;
  }

  int size = SimulationGrid::kMinSize;
  while (window * target_density > size && size < SimulationGrid::kMaxSize) {
    size *= 2;
  }

  grid->size = size;
  grid->window = window;
  grid->pixels_per_mm = size / window;
  grid->feature_size = kFeature;
  grid->diffractive_window = diffractive;
  grid->geometric_window = geometric;
  grid->wavelength = kLambda;
  grid->focal_length = focal_length;
  return true;
}

string PrintGrid(const SimulationGrid& grid) {
  stringstream output;
  output << "  Size: " << grid.size << " x " << grid.size << endl
         << "  Window: " << grid.window << " [mm]"
           << " (diffractive " << grid.diffractive_window
           << ", geometric " << grid.geometric_window << ")" << endl
         << "  Sampling: " << grid.pixels_per_mm << " [pixels/mm]" << endl
         << "  Feature Size: " << grid.feature_size << " [mm]" << endl;
  return output.str();
}

}
