// File Description
// Author: Philip Salvaggio

#include "logging.h"

#include "base/str_utils.h"

#include <iostream>
#include <sstream>

using namespace std;
using namespace apsim;

std::ostream& mainLog() {
  return apsim_io::Logging::Main();
}

namespace apsim_io {

bool Logging::using_stderr_ = false;
bool Logging::inited_ = false;
ofstream Logging::main_logfile_;
mutex Logging::mutex_;

Logging::Logging() {}

bool Logging::Init() {
  lock_guard<mutex> lock(mutex_);
  inited_ = true;
  using_stderr_ = true;
  return true;
}

bool Logging::Init(const string& base_dir) {
  lock_guard<mutex> lock(mutex_);
  if (inited_) return true;

  string fname = AppendSlash(base_dir) + "logs/main_log.txt";
  main_logfile_.open(fname.c_str());
  if (!main_logfile_.is_open()) {
    return false;
  }

  inited_ = true;
  return true;
}

ostream& Logging::Main() {
  thread_local LogLineBuffer buffer;
  thread_local ostream stream(&buffer);
  return stream;
}

void Logging::Write(const string& text) {
  lock_guard<mutex> lock(mutex_);
  if (!inited_) {
    cerr << "Warning: Please call apsim_io::Logging::Init() before trying "
         << "to log messages." << endl;
    inited_ = true;
    using_stderr_ = true;
  }

  ostream& output = using_stderr_ ? cerr : main_logfile_;
  output << text;
  output.flush();
}

LogLineBuffer::~LogLineBuffer() {
  sync();
}

int LogLineBuffer::sync() {
  if (!str().empty()) {
    Logging::Write(str());
    str("");
  }
  return 0;
}

string PrintConfig(const SimulationConfig& config) {
  stringstream output;
  if (config.has_base_directory()) {
    output << "Base directory: " << config.base_directory() << endl;
  }
  output << "Exposure: " << config.exposure() << endl
         << "Input image: " << config.input_image_filename() << endl
         << "Output image: " << config.output_image_filename() << endl
         << "Camera:" << endl << PrintCamera(config.camera())
         << "Aperture:" << endl << PrintAperture(config.aperture())
         << "Options:" << endl << PrintOptions(config.options());

  return output.str();
}

string PrintCamera(const CameraParameters& camera) {
  stringstream output;
  if (camera.has_model_name()) {
    output << "  Model: " << camera.model_name() << endl;
  }
  output << "  Focal Length: " << camera.focal_length() << " [mm]" << endl
         << "  Sensor: " << camera.sensor_width() << " x "
           << camera.sensor_height() << " [mm]" << endl
         << "  Wavelength: " << camera.wavelength() << " [nm]" << endl
         << "  ISO: " << camera.iso() << endl;
  return output.str();
}

string PrintAperture(const ApertureParameters& aperture) {
  stringstream output;
  output << "  Type: "
         << ApertureParameters::ApertureType_Name(aperture.type()) << endl
         << "  Diameter: " << aperture.diameter() << " [mm]" << endl;

  if (aperture.has_inner_diameter()) {
    output << "  Inner Diameter: " << aperture.inner_diameter() << " [mm]"
           << endl;
  }
  if (aperture.has_slit_width()) {
    output << "  Slit Width: " << aperture.slit_width() << " [mm]" << endl;
  }
  if (aperture.has_slit_height()) {
    output << "  Slit Height: " << aperture.slit_height() << " [mm]" << endl;
  }
  if (aperture.has_count()) {
    output << "  Count: " << aperture.count() << endl;
  }
  if (aperture.has_spread()) {
    output << "  Spread: " << aperture.spread() << " [mm]" << endl;
  }
  if (aperture.type() == ApertureParameters::ZONE_PLATE) {
    output << "  Profile: " << ApertureParameters::ZonePlateProfile_Name(
                                   aperture.zone_plate_profile()) << endl;
  }
  if (aperture.type() == ApertureParameters::MULTI_DOT) {
    output << "  Pattern: " << ApertureParameters::MultiDotPattern_Name(
                                   aperture.multi_dot_pattern()) << endl;
  }
  if (aperture.has_seed()) {
    output << "  Seed: " << aperture.seed() << endl;
  }
  output << "  Rotation: " << aperture.rotation() << " [deg]" << endl;

  return output.str();
}

string PrintOptions(const SimulationOptions& options) {
  stringstream output;
  output << "  Polychromatic: " << (options.polychromatic() ? "yes" : "no")
         << endl
         << "  Diffraction: " << (options.render_diffraction() ? "yes" : "no")
         << endl
         << "  Vignetting: " << (options.vignetting() ? "yes" : "no") << endl
         << "  Convolution: " << SimulationOptions::ConvolutionStrategy_Name(
                                     options.convolution_strategy()) << endl
         << "  Edge Mode: "
           << SimulationOptions::EdgeMode_Name(options.edge_mode()) << endl
         << "  Processing Width: " << options.processing_width()
           << " [pixels]" << endl;
  return output.str();
}

}
