// A complex scalar field sampled on a square simulation grid. The field starts
// out as the transmission of an aperture (real part = mask, no phase) and is
// propagated in place to the sensor plane.
// Author: Philip Salvaggio

#ifndef COMPLEX_FIELD_H
#define COMPLEX_FIELD_H

#include <opencv2/core/core.hpp>

namespace apsim {

class ComplexField {
 public:
  explicit ComplexField(int size);
  ComplexField(const ComplexField& other) = delete;
  ComplexField(ComplexField&& other);
  ~ComplexField();

  ComplexField& operator=(const ComplexField& other) = delete;
  ComplexField& operator=(ComplexField&& other);

  // Build a field from a transmission mask. The imaginary part is zero.
  static ComplexField FromMask(const cv::Mat_<double>& mask);

  cv::Mat_<double>& real_part() { return real_; }
  cv::Mat_<double>& imaginary_part() { return imag_; }
  const cv::Mat_<double>& real_part() const { return real_; }
  const cv::Mat_<double>& imaginary_part() const { return imag_; }

  int size() const { return real_.rows; }

  // |field|^2 at every sample.
  cv::Mat_<double> Intensity() const;

  // Sum of the intensity over the grid.
  double Energy() const;

 private:
  cv::Mat_<double> real_;
  cv::Mat_<double> imag_;
};

}

#endif  // COMPLEX_FIELD_H
