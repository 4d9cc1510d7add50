// File Description
// Author: Philip Salvaggio

#include "sensor_noise.h"

#include <algorithm>

using namespace cv;

namespace apsim {

namespace {

// Full width of the noise at ISO 3200, in 8-bit counts.
const double kNoiseAtIso3200 = 15;

}

SensorNoise::SensorNoise() : rng_(getTickCount()) {}
SensorNoise::SensorNoise(uint64_t seed) : rng_(seed) {}
SensorNoise::~SensorNoise() {}

double SensorNoise::NoiseWidth(double iso) {
  return (iso / 3200) * kNoiseAtIso3200 / 255;
}

void SensorNoise::AddSensorNoise(double iso, double base_iso, Mat* image) {
  if (!image || image->type() != CV_64FC4 || iso <= base_iso) return;

  const double kWidth = NoiseWidth(iso);

  Mat_<Vec4d> pixels = *image;
  for (int i = 0; i < pixels.rows; i++) {
    for (int j = 0; j < pixels.cols; j++) {
      Vec4d& pixel = pixels(i, j);
      if (pixel[3] == 0) continue;

      for (int c = 0; c < 3; c++) {
        double noise = (rng_.uniform(0.0, 1.0) - 0.5) * kWidth;
        pixel[c] = std::max(0.0, pixel[c] + noise);
      }
    }
  }
}

}
