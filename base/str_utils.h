// String helpers for log messages and output filenames.
// Author: Philip Salvaggio

#ifndef STR_UTILS_H
#define STR_UTILS_H

#include <cstdarg>
#include <string>

namespace apsim {

void StringAppendf(std::string* output, const char* format, va_list vargs);

std::string StringPrintf(const char* format, ...);


std::string AppendSlash(const std::string& input);

}

#endif  // STR_UTILS_H
