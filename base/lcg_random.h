// A small linear congruential generator used by the seeded aperture shapes.
// Every shape that needs random numbers owns one of these, so the same
// descriptor always rasterizes to the same mask.
// Author: Philip Salvaggio

#ifndef LCG_RANDOM_H
#define LCG_RANDOM_H

#include <cstdint>

namespace apsim {

class LcgRandom {
 public:
  static constexpr uint32_t kDefaultSeed = 12345;

  // A seed of zero selects kDefaultSeed.
  explicit LcgRandom(uint32_t seed) : state_(seed) {
    if (state_ == 0) state_ = kDefaultSeed;
  }

  // Uniform sample in [0, 1).
  double Next() {
    state_ = state_ * 1664525u + 1013904223u;
    return state_ / 4294967296.0;
  }

  uint32_t state() const { return state_; }

 private:
  uint32_t state_;
};

}

#endif  // LCG_RANDOM_H
