// Conversions between 8-bit display values and linear light, and the
// radiometric effects applied to a convolved image before display.
// Author: Philip Salvaggio

#ifndef RADIOMETRY_H
#define RADIOMETRY_H

#include <opencv2/core/core.hpp>

namespace apsim {

const double kDisplayGamma = 2.2;

// Decode an 8-bit RGBA image to CV_64FC4 with values in [0, 1]. If linearize
// is set, the color channels are raised to kDisplayGamma.
bool DecodeSource(const cv::Mat& source, bool linearize, cv::Mat* output);

// Cosine fourth falloff (f^2 / (f^2 + r^2))^2, where r is the distance from
// the image center in millimeters on the sensor.
//
// Parameters:
//  focal_length  [mm]
//  sensor_width  [mm], spans the image width
//  image         Input/Output: CV_64FC4 image. Alpha is left alone.
void ApplyVignetting(double focal_length, double sensor_width,
                     cv::Mat* image);

// ACES filmic curve x (a x + b) / (x (c x + d) + e), clamped to [0, 1].
double AcesFilmic(double x);

// Tone map a linear CV_64FC4 image and encode it with 1 / kDisplayGamma into
// an 8-bit RGBA image with an opaque alpha channel.
bool ToneMapAndEncode(const cv::Mat& linear, cv::Mat* output);

}

#endif  // RADIOMETRY_H
