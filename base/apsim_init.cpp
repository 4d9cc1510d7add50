// File Description
// Author: Philip Salvaggio

#include "apsim_init.h"

#include "base/filesystem.h"
#include "base/simulation_config.pb.h"
#include "base/str_utils.h"
#include "io/logging.h"
#include "io/protobuf_reader.h"

#include <iostream>

using namespace std;

namespace apsim {

bool ApsimInit(const string& config_path, SimulationConfig* sim_config) {
  if (!sim_config) {
    cerr << "Invalid Pointer passed to apsim::ApsimInit()" << endl;
    return false;
  }

  string version = "1.0.0";

  // Initialize logging.
  string config_file = ResolvePath(config_path);
  string base_dir;
  if (is_dir(config_file)) {
    base_dir = AppendSlash(config_file);
    config_file = base_dir + "input/simulation.txt";
    if (!apsim_io::Logging::Init(base_dir)) {
      cerr << "Could not open log files." << endl;
      return false;
    }
  } else if (!apsim_io::Logging::Init()) {
    cerr << "Could not initialize logging." << endl;
    return false;
  }

  // Write the header to the log file
  mainLog() << "Aperture Simulation (APSIM " << version << ") Main Log File"
            << endl << endl;

  // Initialize the simulation parameters.
  if (!apsim_io::ProtobufReader::Read(config_file, sim_config)) {
    cerr << "Could not read simulation file." << endl;
    return false;
  }
  if (!base_dir.empty()) sim_config->set_base_directory(base_dir);

  mainLog() << "Configuration Parameters:" << endl
            << apsim_io::PrintConfig(*sim_config) << endl;

  return true;
}

}
