// File Description
// Author: Philip Salvaggio

#include "opencv_utils.h"

#include "io/logging.h"

#include <algorithm>
#include <cmath>
#include <iostream>

using namespace std;
using namespace cv;

namespace apsim {

Mat_<uint8_t> ByteScale(const Mat& input) {
  double min, max;
  minMaxIdx(input, &min, &max);
  return ByteScale(input, min, max);
}

Mat_<uint8_t> ByteScale(const Mat& input, double min, double max) {
  Mat_<uint8_t> output;
  double range = max - min;
  if (range <= 0) range = 1;
  input.convertTo(output, CV_8U, 255 / range, -min * 255 / range);
  return output;
}

Mat_<uint8_t> LogScale(const Mat& input, double decades) {
  double min, max;
  minMaxIdx(input, &min, &max);
  if (max <= 0) return Mat_<uint8_t>::zeros(input.size());

  const double kFloor = pow(10, -decades);

  Mat_<double> normalized;
  input.convertTo(normalized, CV_64F, 1 / max);
  normalized = cv::max(normalized, kFloor);

  Mat_<double> log_input;
  cv::log(normalized, log_input);
  log_input /= log(10.0);

  return ByteScale(log_input, -decades, 0);
}

Mat ColorScale(const Mat& input, int colormap) {
  Mat output;
  applyColorMap(ByteScale(input), output, colormap);
  return output;
}

void GetAzimuthalProfile(const Mat_<double>& input, const Point2d& center,
                         vector<double>* output) {
  if (!output) return;
  output->clear();

  int profile_size = std::min(input.rows, input.cols) / 2;
  vector<double> sums(profile_size, 0);
  vector<int> counts(profile_size, 0);

  for (int i = 0; i < input.rows; i++) {
    for (int j = 0; j < input.cols; j++) {
      int r = static_cast<int>(round(hypot(j - center.x, i - center.y)));
      if (r >= profile_size) continue;
      sums[r] += input(i, j);
      counts[r]++;
    }
  }

  output->reserve(profile_size);
  for (int r = 0; r < profile_size; r++) {
    output->push_back(counts[r] > 0 ? sums[r] / counts[r] : 0);
  }
}

bool ConvertToRgba(const Mat& input, Mat* output) {
  if (!output || input.empty() || input.depth() != CV_8U) {
    mainLog() << "Error: Expected an 8-bit image." << endl;
    return false;
  }

  switch (input.channels()) {
    case 1: cvtColor(input, *output, COLOR_GRAY2RGBA); return true;
    case 3: cvtColor(input, *output, COLOR_BGR2RGBA); return true;
    case 4: cvtColor(input, *output, COLOR_BGRA2RGBA); return true;
  }

  mainLog() << "Error: Unsupported number of channels: " << input.channels()
            << endl;
  return false;
}

Mat RgbaToBgra(const Mat& input) {
  Mat output;
  cvtColor(input, output, COLOR_RGBA2BGRA);
  return output;
}

Mat CreatePointSource(int width, int height, double sensor_width,
                      double diameter) {
  Mat source(height, width, CV_8UC4, Scalar(0, 0, 0, 255));

  const double kPixelsPerMm = width / sensor_width;
  const int kShift = 8;
  double radius = std::max(0.5, diameter / 2 * kPixelsPerMm);

  circle(source, Point((width / 2) << kShift, (height / 2) << kShift),
         cvRound(radius * (1 << kShift)), Scalar(255, 255, 255, 255), FILLED,
         LINE_8, kShift);
  return source;
}

}
