// Draws aperture primitives, given in millimeters relative to the optical
// axis, into a transmission mask. The painter maps aperture coordinates to
// grid cells, applies the aperture's rotation and enforces the minimum
// feature size, so that the shapes only describe geometry.
// Author: Philip Salvaggio

#ifndef MASK_PAINTER_H
#define MASK_PAINTER_H

#include <opencv2/core/core.hpp>

#include <vector>

namespace apsim {

struct SimulationGrid;

class MaskPainter {
 public:
  // Smallest stroke width, rectangle width or disc diameter that will be drawn.
  // [cells]
  static constexpr double kMinFeatureCells = 1.5;

  // Parameters:
  //  grid      Sampling of the mask
  //  rotation  Rotation of the aperture, CCW in degrees
  //  mask      The mask to draw into. Must be grid.size square and CV_64F.
  MaskPainter(const SimulationGrid& grid, double rotation,
              cv::Mat_<double>* mask);

  double pixels_per_mm() const { return pixels_per_mm_; }

  // The value written by the fill operations. 1 opens, 0 closes.
  void set_value(double value) { value_ = value; }

  void FillCircle(const cv::Point2d& center, double radius);
  void FillRect(const cv::Point2d& center, double width, double height);
  void FillPolygon(const std::vector<cv::Point2d>& vertices);

  // Draws a polyline with round joins and caps.
  void Stroke(const std::vector<cv::Point2d>& points, double width,
              bool closed = false);

  // Position of the center of a cell in aperture coordinates, with the
  // rotation undone. [mm]
  cv::Point2d CellToAperture(int row, int col) const;

 private:
  cv::Point ToFixedPoint(const cv::Point2d& point) const;
  int ToFixedLength(double length) const;
  void FillSegment(const cv::Point2d& p1, const cv::Point2d& p2,
                   double width);

  cv::Mat_<double>& mask_;
  double pixels_per_mm_;
  double center_;
  double cos_;
  double sin_;
  double value_;
};

}

#endif  // MASK_PAINTER_H
