// FFTW's planner is not thread-safe. Every call that creates or destroys a
// plan must hold this lock; fftw_execute() does not need it.
// Author: Philip Salvaggio

#ifndef FFTW_LOCK_H
#define FFTW_LOCK_H

#include <mutex>

namespace apsim {

std::mutex& fftw_lock();

}

#endif  // FFTW_LOCK_H
