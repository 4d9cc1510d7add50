// File Description
// Author: Philip Salvaggio

#include "mask_painter.h"

#include "base/math_utils.h"
#include "base/simulation_grid.h"

#include <opencv2/imgproc/imgproc.hpp>

#include <algorithm>
#include <cmath>

using namespace std;
using namespace cv;

namespace apsim {

namespace {

// Fractional bits of the fixed-point coordinates given to the OpenCV drawing
// functions.
const int kShift = 8;
const double kFixedScale = 1 << kShift;

}

constexpr double MaskPainter::kMinFeatureCells;

MaskPainter::MaskPainter(const SimulationGrid& grid, double rotation,
                         Mat_<double>* mask)
    : mask_(*mask),
      pixels_per_mm_(grid.pixels_per_mm),
      center_(grid.center()),
      cos_(cos(DegreesToRadians(rotation))),
      sin_(sin(DegreesToRadians(rotation))),
      value_(1) {}

Point MaskPainter::ToFixedPoint(const Point2d& point) const {
  double x = point.x * cos_ - point.y * sin_;
  double y = point.x * sin_ + point.y * cos_;
  return Point(cvRound((center_ + x * pixels_per_mm_) * kFixedScale),
               cvRound((center_ + y * pixels_per_mm_) * kFixedScale));
}

int MaskPainter::ToFixedLength(double length) const {
  return cvRound(length * pixels_per_mm_ * kFixedScale);
}

Point2d MaskPainter::CellToAperture(int row, int col) const {
  double x = (col - center_) / pixels_per_mm_;
  double y = (row - center_) / pixels_per_mm_;
  return Point2d(x * cos_ + y * sin_, -x * sin_ + y * cos_);
}

void MaskPainter::FillCircle(const Point2d& center, double radius) {
  const double kMinRadius = kMinFeatureCells / 2 / pixels_per_mm_;
  radius = max(radius, kMinRadius);

  circle(mask_, ToFixedPoint(center), ToFixedLength(radius), Scalar(value_),
         FILLED, LINE_8, kShift);
}

void MaskPainter::FillRect(const Point2d& center, double width,
                           double height) {
  const double kMinSize = kMinFeatureCells / pixels_per_mm_;
  double half_w = max(width, kMinSize) / 2;
  double half_h = max(height, kMinSize) / 2;

  FillPolygon({Point2d(center.x - half_w, center.y - half_h),
               Point2d(center.x + half_w, center.y - half_h),
               Point2d(center.x + half_w, center.y + half_h),
               Point2d(center.x - half_w, center.y + half_h)});
}

void MaskPainter::FillPolygon(const vector<Point2d>& vertices) {
  if (vertices.size() < 3) return;

  vector<Point> fixed;
  fixed.reserve(vertices.size());
  for (const Point2d& vertex : vertices) {
    fixed.push_back(ToFixedPoint(vertex));
  }

  const Point* points = fixed.data();
  int num_points = static_cast<int>(fixed.size());
  fillPoly(mask_, &points, &num_points, 1, Scalar(value_), LINE_8, kShift);
}

void MaskPainter::FillSegment(const Point2d& p1, const Point2d& p2,
                              double width) {
  Point2d direction = p2 - p1;
  double length = norm(direction);
  if (length <= 0) return;

  Point2d normal(-direction.y / length * width / 2,
                 direction.x / length * width / 2);
  fillConvexPoly(mask_, vector<Point>{ToFixedPoint(p1 + normal),
                                      ToFixedPoint(p2 + normal),
                                      ToFixedPoint(p2 - normal),
                                      ToFixedPoint(p1 - normal)},
                 Scalar(value_), LINE_8, kShift);
}

void MaskPainter::Stroke(const vector<Point2d>& points, double width,
                         bool closed) {
  if (points.empty()) return;

  width = max(width, kMinFeatureCells / pixels_per_mm_);

  for (size_t i = 0; i < points.size(); i++) {
    circle(mask_, ToFixedPoint(points[i]), ToFixedLength(width / 2),
           Scalar(value_), FILLED, LINE_8, kShift);
    if (i + 1 < points.size()) {
      FillSegment(points[i], points[i + 1], width);
    }
  }

  if (closed && points.size() > 2) {
    FillSegment(points.back(), points.front(), width);
  }
}

}
