#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace util {

template <typename Out>
void split(const std::string& s, char delim, Out result) {
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    if (!item.empty()) *(result++) = item;
  }
}
std::vector<std::string> split(const std::string& s, char delim);

// Removes leading and trailing whitespace.
std::string trim(const std::string& s);

// Thread-safe strerror.
std::string StrError(int err);

// Rounds to the given number of decimal digits.
double Round(double value, int digits = 2);

// Converts a timeout in seconds to milliseconds, rounding up. Returns 0 for
// values that are not positive, and saturates at the largest int64_t.
int64_t SecondsToMillis(double seconds);

}  // namespace util
#endif
