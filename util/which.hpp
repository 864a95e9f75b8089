#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the full path of the
// first executable named cmd in the directories of $PATH, or an empty string.
// Commands containing a slash are returned as they are if executable.
// Found paths are cached unless use_cache is false; a cached path is returned
// even if the file is no longer there. Throws std::runtime_error if $PATH is
// not set.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
