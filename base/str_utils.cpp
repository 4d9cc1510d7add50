// File Description
// Author: Philip Salvaggio

#include "str_utils.h"

#include <cstdio>

using namespace std;

namespace apsim {

void StringAppendf(string* output, const char* format, va_list vargs) {
  int size = 1024;
  char* buffer = NULL;
  int length = 0;

  for (;;) {
    buffer = new char[size];

    va_list tmp_vargs;
    va_copy(tmp_vargs, vargs);
    length = vsnprintf(buffer, size, format, tmp_vargs);
    va_end(tmp_vargs);

    if (length >= 0 && length < size) {
      break;
    }

    delete[] buffer;

    if (length >= size) {
      size = length + 1;
    } else {
      return;
    }
  }

  output->append(buffer, length);
  delete[] buffer;
}

string StringPrintf(const char* format, ...) {
  va_list vargs;
  va_start(vargs, format);
  string output;
  StringAppendf(&output, format, vargs);
  va_end(vargs);
  return output;
}

string AppendSlash(const string& input) {
  if (input.empty() || input.back() != '/') {
    return input + '/';
  }
  return input;
}

}
