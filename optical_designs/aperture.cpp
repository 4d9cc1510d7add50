// File Description
// Author: Philip Salvaggio

#include "aperture.h"

#include "base/mask_painter.h"
#include "base/simulation_grid.h"
#include "io/logging.h"
#include "optical_designs/bitmap_mask.h"
#include "optical_designs/circular.h"
#include "optical_designs/coded_aperture.h"
#include "optical_designs/fractal.h"
#include "optical_designs/multi_dot.h"
#include "optical_designs/parametric_curve.h"
#include "optical_designs/photon_sieve.h"
#include "optical_designs/slit.h"
#include "optical_designs/star.h"
#include "optical_designs/zone_plate.h"

#include <iostream>

using namespace std;
using namespace cv;

namespace apsim {

Aperture::Aperture(const ApertureParameters& params)
    : aperture_params_(params) {}

Aperture::~Aperture() {}

void Aperture::GetApertureMask(const SimulationGrid& grid,
                               Mat_<double>* output) const {
  *output = Mat_<double>::zeros(grid.size, grid.size);

  MaskPainter painter(grid, aperture_params_.rotation(), output);
  GetApertureTemplate(grid, &painter, output);

  // Overlapping primitives and resampled bitmaps can leave the valid range.
  Mat_<double> clipped = cv::min(*output, 1.0);
  *output = cv::max(clipped, 0.0);
}

// ApertureFactory Implementation.
Aperture* ApertureFactory::Create(const ApertureParameters& params,
                                  const Mat& imported_mask) {
  switch (params.type()) {
    case ApertureParameters::PINHOLE: return new Circular(params);
    case ApertureParameters::ANNULAR: return new Annular(params);
    case ApertureParameters::ZONE_PLATE: return new ZonePlate(params);
    case ApertureParameters::PHOTON_SIEVE: return new PhotonSieve(params);
    case ApertureParameters::SLIT: return new Slit(params);
    case ApertureParameters::CROSS: return new Cross(params);
    case ApertureParameters::SLIT_ARRAY: return new SlitArray(params);
    case ApertureParameters::LITHO_OPC: return new LithoOpc(params);
    case ApertureParameters::STAR: return new Star(params);
    case ApertureParameters::MULTI_DOT: return new MultiDot(params);
    case ApertureParameters::RANDOM: return new RandomDots(params);
    case ApertureParameters::FIBONACCI: return new FibonacciDots(params);
    case ApertureParameters::URA:
      return new UniformlyRedundantArray(params);
    case ApertureParameters::FRACTAL: return new SierpinskiCarpet(params);
    case ApertureParameters::SIERPINSKI_TRIANGLE:
      return new SierpinskiTriangle(params);
    case ApertureParameters::WAVES:
    case ApertureParameters::YIN_YANG:
      return new Waves(params);
    case ApertureParameters::LISSAJOUS: return new Lissajous(params);
    case ApertureParameters::SPIRAL: return new Spiral(params);
    case ApertureParameters::ROSETTE: return new Rosette(params);
    case ApertureParameters::FREEFORM: return new Freeform(params);
    case ApertureParameters::CUSTOM:
      return new BitmapMask(params, imported_mask);
  }

  mainLog() << "ApertureFactory error: Unsupported aperture type." << endl;
  return nullptr;
}

}
