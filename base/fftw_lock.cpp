// File Description
// Author: Philip Salvaggio

#include "fftw_lock.h"

namespace apsim {

std::mutex& fftw_lock() {
  static std::mutex lock;
  return lock;
}

}
