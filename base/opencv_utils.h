// File Description
// Author: Philip Salvaggio

#ifndef OPENCV_UTILS_H
#define OPENCV_UTILS_H

#include <opencv2/core/core.hpp>
#include <opencv2/imgproc/imgproc.hpp>

#include <vector>

namespace apsim {

// Linearly stretch an image to [0, 255].
cv::Mat_<uint8_t> ByteScale(const cv::Mat& input);

cv::Mat_<uint8_t> ByteScale(const cv::Mat& input, double min, double max);

// Byte scale the base 10 logarithm of an image, showing the given number of
// decades below its maximum.
cv::Mat_<uint8_t> LogScale(const cv::Mat& input, double decades = 5);

cv::Mat ColorScale(const cv::Mat& input, int colormap = cv::COLORMAP_JET);

// Gets the azimuthally averaged profile of an image about a center point.
// Sample i is the mean of the pixels whose distance from the center rounds to
// i, out to the inscribed circle of the frame.
//
// Paramaters:
//  input - The 2D image, CV_64F
//  center - Center of the profile, (x, y) in pixels
//  output - Output: the profile.
void GetAzimuthalProfile(const cv::Mat_<double>& input,
                         const cv::Point2d& center,
                         std::vector<double>* output);

// Convert an image as read by cv::imread (gray, BGR or BGRA, 8-bit) to RGBA.
bool ConvertToRgba(const cv::Mat& input, cv::Mat* output);

// Convert an RGBA image to BGRA for cv::imwrite.
cv::Mat RgbaToBgra(const cv::Mat& input);

// A black frame with a white disc in the middle, as seen by a sensor of the
// given width looking at a point source.
//
// Parameters:
//  width, height  Size of the frame [pixels]
//  sensor_width   Physical width of the frame [mm]
//  diameter       Diameter of the disc on the sensor [mm]. At least one pixel
//                 is lit.
cv::Mat CreatePointSource(int width, int height, double sensor_width,
                          double diameter);

}

#endif  // OPENCV_UTILS_H
