// This is a common include file for the main components of the APSIM model.
// Author: Philip Salvaggio

#ifndef APSIM_H
#define APSIM_H

// Core headers of the library.
#include "base/aperture_geometry.h"
#include "base/aperture_parameters.pb.h"
#include "base/apsim_init.h"
#include "base/filesystem.h"
#include "base/math_utils.h"
#include "base/opencv_utils.h"
#include "base/optics_report.h"
#include "base/point_spread_function.h"
#include "base/radiometry.h"
#include "base/sensor_noise.h"
#include "base/simulation_config.pb.h"
#include "base/simulation_grid.h"
#include "base/simulation_worker.h"
#include "base/simulator.h"
#include "base/str_utils.h"

// Input/output headers.
#include "io/logging.h"
#include "io/protobuf_reader.h"

// Aperture module headers. A factory is used here, so only aperture.h should
// be needed for most applications. Others can be explicitly included when
// needed.
#include "optical_designs/aperture.h"

// Convolution of images with point spread functions.
#include "convolution/convolution_engine.h"

#endif  // APSIM_H
