// File Description
// Author: Philip Salvaggio

#ifndef MATH_UTILS_H
#define MATH_UTILS_H

#include <cmath>
#include <cstdint>
#include <vector>

namespace apsim {

inline bool IsPowerOfTwo(int n) {
  return n > 0 && (n & (n - 1)) == 0;
}

inline bool IsPrime(int n) {
  if (n < 2) return false;
  for (int64_t i = 2; i * i <= n; i++) {
    if (n % i == 0) return false;
  }
  return true;
}

// residues[n] is true if n is a nonzero quadratic residue modulo m.
inline std::vector<bool> QuadraticResidues(int m) {
  std::vector<bool> residues(m > 0 ? m : 0, false);
  for (int64_t x = 1; x < m; x++) {
    residues[(x * x) % m] = true;
  }
  if (m > 0) residues[0] = false;
  return residues;
}

inline double Clamp(double value, double min, double max) {
  return value < min ? min : (value > max ? max : value);
}

inline double DegreesToRadians(double degrees) {
  return degrees * M_PI / 180;
}

}

#endif  // MATH_UTILS_H
