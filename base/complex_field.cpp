// File Description
// Author: Philip Salvaggio

#include "complex_field.h"

using namespace std;
using namespace cv;

namespace apsim {

ComplexField::ComplexField(int size)
    : real_(Mat_<double>::zeros(size, size)),
      imag_(Mat_<double>::zeros(size, size)) {}

ComplexField::ComplexField(ComplexField&& other)
    : real_(move(other.real_)),
      imag_(move(other.imag_)) {}

ComplexField::~ComplexField() {}

ComplexField& ComplexField::operator=(ComplexField&& other) {
  if (this == &other) return *this;

  real_ = move(other.real_);
  imag_ = move(other.imag_);
  return *this;
}

ComplexField ComplexField::FromMask(const Mat_<double>& mask) {
  ComplexField field(mask.rows);
  mask.copyTo(field.real_);
  return field;
}

Mat_<double> ComplexField::Intensity() const {
  Mat_<double> intensity = real_.mul(real_) + imag_.mul(imag_);
  return intensity;
}

double ComplexField::Energy() const {
  return sum(Intensity())[0];
}

}
