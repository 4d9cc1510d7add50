// A simple utility for visualizing an aperture function and its PSF.
// Author: Philip Salvaggio

#include "apsim.h"

#include <cstdlib>
#include <iostream>
#include <opencv2/core/core.hpp>
#include <opencv2/highgui/highgui.hpp>
#include <opencv2/imgcodecs/imgcodecs.hpp>
#include <string>
#include <vector>

#include <gflags/gflags.h>

using namespace std;
using namespace cv;
using namespace apsim;

DEFINE_double(wavelength, 0,
              "Wavelength of the PSF [nm]. Defaults to the camera's.");
DEFINE_double(density, 0,
              "Grid sampling [pixels/mm]. Defaults to the processing width "
              "over the sensor width.");
DEFINE_double(decades, 5, "Dynamic range of the log-scaled PSF.");
DEFINE_bool(output_profile, false,
            "Whether to log the azimuthal profile of the PSF.");
DEFINE_int32(colormap, -1,
             "Which colormap to apply to the PSF output. See OpenCV"
             "documentation for values.");

int main(int argc, char** argv) {
  google::ParseCommandLineFlags(&argc, &argv, true);
  if (argc < 2) {
    cerr << "Usage: ./visualize_aperture config_file" << endl;
    return 1;
  }

  SimulationConfig sim_config;
  if (!ApsimInit(argv[1], &sim_config)) return 1;

  const CameraParameters& camera = sim_config.camera();
  double wavelength = FLAGS_wavelength > 0 ? FLAGS_wavelength
                                           : camera.wavelength();
  double density = FLAGS_density > 0 ? FLAGS_density :
      sim_config.options().processing_width() / camera.sensor_width();

  Mat imported_mask;
  if (sim_config.aperture().type() == ApertureParameters::CUSTOM) {
    Mat bgr = imread(ResolvePath(sim_config.base_directory() +
                                 sim_config.mask_image_filename()));
    if (bgr.empty() || !ConvertToRgba(bgr, &imported_mask)) {
      cerr << "Could not read the mask image." << endl;
      return 1;
    }
  }

  Simulator simulator;
  WavelengthPsf psf;
  if (!simulator.ComputePsf(sim_config.aperture(), camera,
                            sim_config.options(), wavelength, density,
                            imported_mask, &psf)) {
    return 1;
  }

  mainLog() << PrintGrid(psf.grid) << endl
            << PrintOpticsReport(ComputeOpticsReport(camera,
                                                     sim_config.aperture()))
            << endl;

  imwrite("mask.png", ByteScale(psf.mask, 0, 1));

  Mat output_psf = LogScale(psf.psf.data(), FLAGS_decades);
  if (FLAGS_colormap >= 0) {
    output_psf = ColorScale(output_psf, FLAGS_colormap);
  }
  imwrite("psf.png", output_psf);

  if (FLAGS_output_profile) {
    vector<double> profile;
    double center = psf.grid.center();
    GetAzimuthalProfile(psf.psf.data(), Point2d(center, center), &profile);

    mainLog() << "Azimuthal Profile [mm, relative intensity]:" << endl;
    double peak = profile.empty() ? 0 : profile[0];
    for (size_t r = 0; r < profile.size(); r++) {
      mainLog() << r * psf.grid.mm_per_pixel() << "\t"
                << (peak > 0 ? profile[r] / peak : 0) << endl;
    }
  }

  return 0;
}
