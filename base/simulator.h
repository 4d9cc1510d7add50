// Simulates photographs taken through a physical aperture. A request holds a
// source image, the aperture and the camera. The simulator computes the PSF
// of the aperture at each wavelength and blurs the image with it, then
// applies the sensor's radiometry.
// Author: Philip Salvaggio

#ifndef SIMULATOR_H
#define SIMULATOR_H

#include "base/aperture_parameters.pb.h"
#include "base/point_spread_function.h"
#include "base/simulation_config.pb.h"
#include "base/simulation_grid.h"

#include <opencv2/core/core.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace apsim {

class Propagator;

struct SimulationRequest {
  ApertureParameters aperture;
  CameraParameters camera;
  SimulationOptions options;

  // 8-bit RGBA source image.
  cv::Mat source;
  double exposure = 1;

  // 8-bit bitmap of CUSTOM apertures. Optional.
  cv::Mat imported_mask;
};

struct SimulationResponse {
  bool success = false;

  // 8-bit RGBA image. Freshly allocated for every response.
  cv::Mat image;
  std::string error;
};

// Everything computed for one wavelength.
struct WavelengthPsf {
  double wavelength = 0;    // [nm]
  SimulationGrid grid;
  cv::Mat_<double> mask;
  PointSpreadFunction psf;
};

class Simulator {
 public:
  // Returns true once the request should be abandoned.
  using CancelCheck = std::function<bool()>;

  Simulator();
  ~Simulator();

  Simulator(const Simulator& other) = delete;
  Simulator& operator=(const Simulator& other) = delete;

  // Run a request. Failures never escape this call, they are returned in the
  // response and written to the main log.
  //
  // Parameters:
  //  request    The request
  //  cancelled  Polled between pipeline stages. If it returns true, the run
  //             stops and reports a failure.
  SimulationResponse Run(const SimulationRequest& request,
                         const CancelCheck& cancelled = CancelCheck()) const;

  // Compute the PSF of an aperture at one wavelength, sampled on the
  // simulation grid.
  //
  // Parameters:
  //  aperture        The aperture descriptor
  //  camera          The camera, for the focal length
  //  options         Whether to propagate or use the geometric PSF
  //  wavelength      [nm]
  //  target_density  Requested sampling of the grid [pixels/mm]
  //  imported_mask   Bitmap for CUSTOM apertures
  //  result          Output: grid, mask and PSF
  bool ComputePsf(const ApertureParameters& aperture,
                  const CameraParameters& camera,
                  const SimulationOptions& options,
                  double wavelength,
                  double target_density,
                  const cv::Mat& imported_mask,
                  WavelengthPsf* result) const;

  // Wavelengths to simulate, one for monochrome or red, green and blue for
  // polychromatic simulations. [nm]
  static std::vector<double> SelectWavelengths(
      const CameraParameters& camera, const SimulationOptions& options);

  // Sources wider than the processing width are downsampled to it.
  static bool PrepareSource(const cv::Mat& source, int processing_width,
                            cv::Mat* output);

 private:
  bool RunPipeline(const SimulationRequest& request,
                   const CancelCheck& cancelled,
                   cv::Mat* output,
                   std::string* error) const;

  std::unique_ptr<Propagator> propagator_;
};

}

#endif  // SIMULATOR_H
