// File Description
// Author: Philip Salvaggio

#ifndef FILESYSTEM_H
#define FILESYSTEM_H

#include <string>

namespace apsim {

bool is_dir(const std::string& path);

// Expands ~ and environment variables. Directories get a trailing slash.
std::string ResolvePath(const std::string& path);

}

#endif  // FILESYSTEM_H
