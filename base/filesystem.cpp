// File Description
// Author: Philip Salvaggio

#include "filesystem.h"

#include "base/str_utils.h"

#include <sys/stat.h>
#include <wordexp.h>

namespace apsim {

bool is_dir(const std::string& path) {
  struct stat buf;
  if (stat(path.c_str(), &buf) != 0) return false;
  return S_ISDIR(buf.st_mode);
}

std::string ResolvePath(const std::string& path) {
  wordexp_t exp_result;
  if (wordexp(path.c_str(), &exp_result, 0) != 0) return path;
  std::string new_path = exp_result.we_wordc > 0 ? exp_result.we_wordv[0]
                                                 : path;
  wordfree(&exp_result);

  if (is_dir(new_path)) {
    new_path = AppendSlash(new_path);
  }

  return new_path;
}

}
