// Simulates a photograph of an image through the aperture described by a
// configuration file.
// Author: Philip Salvaggio

#include "apsim.h"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>

#include <opencv2/core/core.hpp>
#include <opencv2/highgui/highgui.hpp>
#include <opencv2/imgcodecs/imgcodecs.hpp>

#include <gflags/gflags.h>

using namespace std;
using namespace cv;
using namespace apsim;

DEFINE_string(config, "",
              "Config file or base directory. May also be given as the first "
              "argument.");
DEFINE_string(input, "", "Source image. Overrides input_image_filename.");
DEFINE_string(output, "", "Output image. Overrides output_image_filename.");
DEFINE_string(mask_image, "",
              "Bitmap for CUSTOM apertures. Overrides mask_image_filename.");
DEFINE_string(mask_output, "", "Optional filename for the aperture mask.");
DEFINE_string(psf_output, "", "Optional filename for the log-scaled PSF.");
DEFINE_bool(point_source, false,
            "Image a point source instead of the input image.");
DEFINE_double(point_source_diameter, 0.01,
              "Diameter of the point source on the sensor [mm].");

namespace {

// Relative filenames in the config are relative to the base directory.
string ConfigPath(const SimulationConfig& config, const string& filename) {
  if (filename.empty() || filename[0] == '/' || filename[0] == '~') {
    return ResolvePath(filename);
  }
  return ResolvePath(config.base_directory() + filename);
}

bool ReadRgba(const string& filename, Mat* output) {
  Mat bgr = imread(filename, IMREAD_UNCHANGED);
  if (bgr.empty()) {
    mainLog() << "Error: Could not read image " << filename << endl;
    return false;
  }
  if (bgr.depth() != CV_8U) {
    Mat tmp;
    bgr.convertTo(tmp, CV_8U, 1 / 257.0);
    bgr = tmp;
  }
  return ConvertToRgba(bgr, output);
}

}

int main(int argc, char** argv) {
  google::ParseCommandLineFlags(&argc, &argv, true);
  string config_path = FLAGS_config;
  if (config_path.empty() && argc >= 2) config_path = argv[1];
  if (config_path.empty()) {
    cerr << "Usage: ./apsim_main [--config] config_file" << endl;
    return 1;
  }

  SimulationConfig sim_config;
  if (!ApsimInit(config_path, &sim_config)) return 1;

  if (!FLAGS_input.empty()) sim_config.set_input_image_filename(FLAGS_input);
  if (!FLAGS_output.empty()) {
    sim_config.set_output_image_filename(FLAGS_output);
  }
  if (!FLAGS_mask_image.empty()) {
    sim_config.set_mask_image_filename(FLAGS_mask_image);
  }

  SimulationRequest request;
  request.aperture = sim_config.aperture();
  request.camera = sim_config.camera();
  request.options = sim_config.options();
  request.exposure = sim_config.exposure();

  // Read in the source image, or image a point source.
  if (FLAGS_point_source || !sim_config.has_input_image_filename()) {
    int width = request.options.processing_width();
    int height = std::max(1, cvRound(width * request.camera.sensor_height() /
                                     request.camera.sensor_width()));
    request.source = CreatePointSource(width, height,
                                       request.camera.sensor_width(),
                                       FLAGS_point_source_diameter);
    mainLog() << "Imaging a point source (" << width << "x" << height << ")"
              << endl;
  } else if (!ReadRgba(ConfigPath(sim_config,
                                  sim_config.input_image_filename()),
                       &request.source)) {
    return 1;
  }

  if (request.aperture.type() == ApertureParameters::CUSTOM) {
    if (!sim_config.has_mask_image_filename()) {
      cerr << "CUSTOM apertures require a mask image." << endl;
      return 1;
    }
    if (!ReadRgba(ConfigPath(sim_config, sim_config.mask_image_filename()),
                  &request.imported_mask)) {
      return 1;
    }
  }

  mainLog() << PrintOpticsReport(
      ComputeOpticsReport(request.camera, request.aperture)) << endl;

  Simulator simulator;

  // Optionally output the aperture and PSF at the camera's wavelength.
  if (!FLAGS_mask_output.empty() || !FLAGS_psf_output.empty()) {
    Mat source;
    if (!Simulator::PrepareSource(request.source,
                                  request.options.processing_width(),
                                  &source)) {
      return 1;
    }

    WavelengthPsf psf;
    if (!simulator.ComputePsf(request.aperture, request.camera,
                              request.options, request.camera.wavelength(),
                              source.cols / request.camera.sensor_width(),
                              request.imported_mask, &psf)) {
      return 1;
    }
    if (!FLAGS_mask_output.empty()) {
      imwrite(FLAGS_mask_output, ByteScale(psf.mask, 0, 1));
    }
    if (!FLAGS_psf_output.empty()) {
      imwrite(FLAGS_psf_output, LogScale(psf.psf.data()));
    }
  }

  SimulationResponse response = simulator.Run(request);
  if (!response.success) {
    cerr << "Simulation failed: " << response.error << endl;
    return 1;
  }

  string output_filename = ConfigPath(sim_config,
                                      sim_config.output_image_filename());
  if (!imwrite(output_filename, RgbaToBgra(response.image))) {
    cerr << "Could not write " << output_filename << endl;
    return 1;
  }
  mainLog() << "Wrote " << output_filename << endl;

  return 0;
}
