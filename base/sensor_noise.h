// A class for adding ISO dependent sensor noise to linear images.
// Author: Philip Salvaggio

#ifndef SENSOR_NOISE_H
#define SENSOR_NOISE_H

#include <opencv2/core/core.hpp>

#include <cstdint>

namespace apsim {

class SensorNoise {
 public:
  // Seeded from the tick counter.
  SensorNoise();
  explicit SensorNoise(uint64_t seed);
  ~SensorNoise();

  // Full width of the uniform noise distribution at an ISO, in linear units
  // where 1 is a full scale 8-bit value.
  static double NoiseWidth(double iso);

  // Add zero mean uniform noise to the color channels of a CV_64FC4 image,
  // independently per channel. Nothing is added unless iso exceeds base_iso.
  // Pixels with zero alpha are left alone. Results are clamped at zero.
  void AddSensorNoise(double iso, double base_iso, cv::Mat* image);

 private:
  cv::RNG rng_;
};

}

#endif  // SENSOR_NOISE_H
