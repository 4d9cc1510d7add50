// File Description
// Author: Philip Salvaggio

#ifndef APSIM_INIT_H
#define APSIM_INIT_H

#include <string>

namespace apsim {

class SimulationConfig;

// Perform initialization of the model.
//
// Parameters:
//  config_path     Either a path to the config file or the base directory. If
//                  this is a path to the file, then logging will be performed
//                  to stderr. If this is a path to a directory, then the
//                  config file should be input/simulation.txt and logging
//                  will be done to logs/main_log.txt.
//  sim_config      Output: SimulationConfig structure read from the file.
bool ApsimInit(const std::string& config_path,
               SimulationConfig* sim_config);

}

#endif  // APSIM_INIT_H
