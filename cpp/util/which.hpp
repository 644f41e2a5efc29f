#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Uses caching to speed up
// lookups, unless explicitly disabled. Commands containing a slash are not
// searched in PATH, they are returned as they are if executable.
// Returns an empty string if the command cannot be found, and throws if PATH
// is not set.
// A cached entry is returned even if the file has been removed since.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
