// File Description
// Author: Philip Salvaggio

#include "radiometry.h"

#include "base/math_utils.h"
#include "io/logging.h"

#include <cmath>
#include <iostream>

using namespace std;
using namespace cv;

namespace apsim {

bool DecodeSource(const Mat& source, bool linearize, Mat* output) {
  if (!output || source.empty() || source.type() != CV_8UC4) {
    mainLog() << "Error: Source image must be 8-bit RGBA." << endl;
    return false;
  }

  source.convertTo(*output, CV_64FC4, 1 / 255.0);
  if (!linearize) return true;

  Mat_<Vec4d> pixels = *output;
  for (int i = 0; i < pixels.rows; i++) {
    for (int j = 0; j < pixels.cols; j++) {
      Vec4d& pixel = pixels(i, j);
      for (int c = 0; c < 3; c++) pixel[c] = pow(pixel[c], kDisplayGamma);
    }
  }
  return true;
}

void ApplyVignetting(double focal_length, double sensor_width, Mat* image) {
  if (!image || image->type() != CV_64FC4 || sensor_width <= 0) return;

  const double kPixelsPerMm = image->cols / sensor_width;
  const double kCenterX = image->cols / 2.0;
  const double kCenterY = image->rows / 2.0;
  const double kF2 = focal_length * focal_length;

  Mat_<Vec4d> pixels = *image;
  for (int i = 0; i < pixels.rows; i++) {
    double dy = (i - kCenterY) / kPixelsPerMm;
    for (int j = 0; j < pixels.cols; j++) {
      double dx = (j - kCenterX) / kPixelsPerMm;
      double cos4 = pow(kF2 / (kF2 + dx*dx + dy*dy), 2);

      Vec4d& pixel = pixels(i, j);
      for (int c = 0; c < 3; c++) pixel[c] *= cos4;
    }
  }
}

double AcesFilmic(double x) {
  const double a = 2.51;
  const double b = 0.03;
  const double c = 2.43;
  const double d = 0.59;
  const double e = 0.14;
  return Clamp(x * (a * x + b) / (x * (c * x + d) + e), 0, 1);
}

bool ToneMapAndEncode(const Mat& linear, Mat* output) {
  if (!output || linear.empty() || linear.type() != CV_64FC4) {
    mainLog() << "Error: Tone mapping expects a CV_64FC4 image." << endl;
    return false;
  }

  Mat_<Vec4b> encoded(linear.size());
  for (int i = 0; i < linear.rows; i++) {
    const Vec4d* row = linear.ptr<Vec4d>(i);
    for (int j = 0; j < linear.cols; j++) {
      Vec4b& pixel = encoded(i, j);
      for (int c = 0; c < 3; c++) {
        double mapped = pow(AcesFilmic(row[j][c]), 1 / kDisplayGamma);
        pixel[c] = saturate_cast<uint8_t>(mapped * 255);
      }
      pixel[3] = 255;
    }
  }

  *output = encoded;
  return true;
}

}
