#include "util/misc.hpp"

#include <cmath>
#include <cstring>
#include <iterator>
#include <limits>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::string trim(const std::string& s) {
  static const constexpr char* kSpaces = " \t\r\n";
  size_t begin = s.find_first_not_of(kSpaces);
  if (begin == std::string::npos) return "";
  size_t end = s.find_last_not_of(kSpaces);
  return s.substr(begin, end - begin + 1);
}

std::string StrError(int err) {
  char buf[2048] = {};
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, sizeof(buf));
#else
  strerror_r(err, buf, sizeof(buf));
  return buf;
#endif
}

double Round(double value, int digits) {
  double scale = std::pow(10.0, digits);
  return std::round(value * scale) / scale;
}

int64_t SecondsToMillis(double seconds) {
  if (!(seconds > 0)) return 0;
  const int64_t max = std::numeric_limits<int64_t>::max();
  // Also catches infinity.
  if (seconds >= static_cast<double>(max / 1000)) return max;
  return static_cast<int64_t>(std::ceil(seconds * 1000));
}

}  // namespace util
