// File Description
// Author: Philip Salvaggio

#ifndef LOGGING_H
#define LOGGING_H

#include "base/aperture_parameters.pb.h"
#include "base/simulation_config.pb.h"

#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace apsim_io {

class Logging {
 public:
  // Initialize and log to standard error.
  static bool Init();

  // Initialize and log to a log file, base_dir/logs/main_log.txt.
  static bool Init(const std::string& base_dir);

  // The calling thread's main log stream. Lines are buffered per thread and
  // written out whole on every flush, so threads can log concurrently.
  static std::ostream& Main();

  // Append text to the log file or standard error.
  static void Write(const std::string& text);

 private:
  static std::ofstream main_logfile_;
  static bool inited_;
  static bool using_stderr_;
  static std::mutex mutex_;

  Logging();
};

// Collects one thread's log output until it is flushed.
class LogLineBuffer : public std::stringbuf {
 public:
  ~LogLineBuffer();

 protected:
  int sync() override;
};

std::string PrintConfig(const apsim::SimulationConfig& config);
std::string PrintCamera(const apsim::CameraParameters& camera);
std::string PrintAperture(const apsim::ApertureParameters& aperture);
std::string PrintOptions(const apsim::SimulationOptions& options);

}

std::ostream& mainLog();

#endif  // LOGGING_H
