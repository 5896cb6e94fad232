#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Names that contain a slash
// are returned as they are if they point to an executable file. Successful
// lookups are cached unless use_cache is false. Returns an empty string if
// the command cannot be found.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
