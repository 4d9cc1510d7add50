// File Description
// Author: Philip Salvaggio

#include "simulator.h"

#include "base/complex_field.h"
#include "base/radiometry.h"
#include "base/sensor_noise.h"
#include "base/str_utils.h"
#include "convolution/convolution_engine.h"
#include "io/logging.h"
#include "optical_designs/aperture.h"
#include "propagation/angular_spectrum_propagator.h"

#include <opencv2/imgproc/imgproc.hpp>

#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>

using namespace std;
using namespace cv;

namespace apsim {

namespace {

const double kDefaultRgbWavelengths[] = {640, 540, 460};

}

Simulator::Simulator() : propagator_(new AngularSpectrumPropagator()) {}

Simulator::~Simulator() {}

vector<double> Simulator::SelectWavelengths(const CameraParameters& camera,
                                            const SimulationOptions& options) {
  if (!options.polychromatic()) {
    return vector<double>{camera.wavelength()};
  }

  if (options.rgb_wavelength_size() == 3) {
    return vector<double>(options.rgb_wavelength().begin(),
                          options.rgb_wavelength().end());
  }
  return vector<double>(begin(kDefaultRgbWavelengths),
                        end(kDefaultRgbWavelengths));
}

bool Simulator::PrepareSource(const Mat& source, int processing_width,
                              Mat* output) {
  if (!output || source.empty() || source.type() != CV_8UC4) {
    mainLog() << "Error: Source image must be a non-empty 8-bit RGBA image."
              << endl;
    return false;
  }

  if (processing_width <= 0 || source.cols <= processing_width) {
    *output = source;
    return true;
  }

  double scale = static_cast<double>(processing_width) / source.cols;
  int rows = max(1, static_cast<int>(round(source.rows * scale)));
  resize(source, *output, Size(processing_width, rows), 0, 0, INTER_AREA);
  return true;
}

bool Simulator::ComputePsf(const ApertureParameters& aperture,
                           const CameraParameters& camera,
                           const SimulationOptions& options,
                           double wavelength,
                           double target_density,
                           const Mat& imported_mask,
                           WavelengthPsf* result) const {
  if (!result) return false;
  result->wavelength = wavelength;

  if (!ComputeSimulationGrid(aperture, wavelength, camera.focal_length(),
                             target_density, &result->grid)) {
    return false;
  }

  unique_ptr<Aperture> ap(ApertureFactory::Create(aperture, imported_mask));
  if (!ap) return false;

  ap->GetApertureMask(result->grid, &result->mask);

  if (!options.render_diffraction()) {
    return PointSpreadFunction::FromMask(result->mask, &result->psf);
  }

  ComplexField field = ComplexField::FromMask(result->mask);
  if (!propagator_->Propagate(result->grid, camera.focal_length(), &field)) {
    return false;
  }
  return PointSpreadFunction::FromField(field, &result->psf);
}

bool Simulator::RunPipeline(const SimulationRequest& request,
                            const CancelCheck& cancelled,
                            Mat* output,
                            string* error) const {
  const SimulationOptions& options = request.options;
  const CameraParameters& camera = request.camera;

  auto abandoned = [&]() {
    if (cancelled && cancelled()) {
      *error = "Simulation was abandoned.";
      return true;
    }
    return false;
  };

  if (!std::isfinite(request.exposure) || request.exposure < 0) {
    *error = StringPrintf("Invalid exposure %g.", request.exposure);
    return false;
  }
  if (!(camera.sensor_width() > 0) || !(camera.focal_length() > 0)) {
    *error = "Camera focal length and sensor width must be positive.";
    return false;
  }

  Mat source;
  if (!PrepareSource(request.source, options.processing_width(), &source)) {
    *error = "Invalid source image.";
    return false;
  }

  Mat linear;
  if (!DecodeSource(source, options.linearize_source(), &linear)) {
    *error = "Could not decode the source image.";
    return false;
  }
  if (abandoned()) return false;

  // The aperture grid is sampled at least as finely as the sensor image.
  const double kImageDensity = source.cols / camera.sensor_width();
  const vector<double> kWavelengths = SelectWavelengths(camera, options);
  for (double wavelength : kWavelengths) {
    if (!std::isfinite(wavelength) || wavelength <= 0) {
      *error = StringPrintf("Invalid wavelength %g [nm].", wavelength);
      return false;
    }
  }

  // A kernel wider than twice the image only adds zeros to the convolution.
  const int kMaxKernelSize = 2 * max(source.rows, source.cols) + 1;

  vector<WavelengthPsf> psfs(kWavelengths.size());
  vector<Mat_<double>> kernels(kWavelengths.size());
  vector<char> succeeded(kWavelengths.size(), 0);

  auto compute_kernels = [&](const tbb::blocked_range<size_t>& range) {
    for (size_t i = range.begin(); i != range.end(); i++) {
      PointSpreadFunction kernel;
      if (ComputePsf(request.aperture, camera, options, kWavelengths[i],
                     kImageDensity, request.imported_mask, &psfs[i]) &&
          psfs[i].psf.ResampleToImageScale(psfs[i].grid, kImageDensity,
                                           kMaxKernelSize, &kernel)) {
        kernels[i] = kernel.data();
        succeeded[i] = 1;
      }
    }
  };

  tbb::blocked_range<size_t> all_wavelengths(0, kWavelengths.size());
  if (options.parallelism() && kWavelengths.size() > 1) {
    tbb::parallel_for(all_wavelengths, compute_kernels);
  } else {
    compute_kernels(all_wavelengths);
  }

  for (size_t i = 0; i < kWavelengths.size(); i++) {
    if (!succeeded[i]) {
      *error = StringPrintf("Could not compute the PSF at %g nm.",
                            kWavelengths[i]);
      return false;
    }
    mainLog() << "Grid at " << kWavelengths[i] << " [nm]:" << endl
              << PrintGrid(psfs[i].grid)
              << "  Kernel: " << kernels[i].rows << " x " << kernels[i].cols
              << (psfs[i].psf.is_delta() ? " (delta)" : "") << endl;
  }
  if (abandoned()) return false;

  ConvolutionEngine engine(options);
  Mat blurred;
  if (!engine.Convolve(linear, kernels, request.exposure, &blurred)) {
    *error = "Convolution failed.";
    return false;
  }
  if (abandoned()) return false;

  if (options.vignetting()) {
    ApplyVignetting(camera.focal_length(), camera.sensor_width(), &blurred);
  }

  unique_ptr<SensorNoise> noise(options.has_noise_seed() ?
      new SensorNoise(options.noise_seed()) : new SensorNoise());
  noise->AddSensorNoise(camera.iso(), options.base_iso(), &blurred);

  if (!ToneMapAndEncode(blurred, output)) {
    *error = "Could not encode the output image.";
    return false;
  }
  return !abandoned();
}

SimulationResponse Simulator::Run(const SimulationRequest& request,
                                  const CancelCheck& cancelled) const {
  SimulationResponse response;

  try {
    response.success = RunPipeline(request, cancelled, &response.image,
                                   &response.error);
  } catch (const cv::Exception& e) {
    response.success = false;
    response.error = string("OpenCV error: ") + e.what();
  } catch (const std::exception& e) {
    response.success = false;
    response.error = string("Simulation error: ") + e.what();
  }

  if (!response.success) {
    response.image.release();
    mainLog() << "Simulation failed: " << response.error << endl;
  }
  return response;
}

}
