// Two dimensional discrete Fourier transforms of complex fields, computed with
// FFTW. The forward transform is unnormalized and the inverse transform is
// scaled by 1 / N^2, so that Inverse(Forward(x)) == x.
// Author: Philip Salvaggio

#ifndef FOURIER_TRANSFORM_H
#define FOURIER_TRANSFORM_H

namespace apsim {

class ComplexField;

class FourierTransform {
 public:
  FourierTransform() = delete;

  // Transform a field in place. The field must be square with a power of two
  // side length.
  //
  // Returns:
  //  False if the size is not supported or FFTW could not create a plan.
  static bool Forward(ComplexField* field);
  static bool Inverse(ComplexField* field);

 private:
  static bool Transform(ComplexField* field, bool inverse);
};

}

#endif  // FOURIER_TRANSFORM_H
