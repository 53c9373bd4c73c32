#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the full path of the
// first executable named cmd in the directories listed in PATH, or an empty
// string if there is none. Results are cached unless use_cache is false; a
// cached path is returned even if the file has been removed since.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
