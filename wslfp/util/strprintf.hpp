#pragma once

// printf-like routines that return std::string.

#include <string>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace wslfp {
namespace util {

// Substitute instances of '{}' in the format string with the following
// parameters, using fmt formatting rules.
template <typename... Args>
std::string pprintf(const char* s, Args&&... args) {
    return fmt::format(fmt::runtime(s), std::forward<Args>(args)...);
}

// Format a closed interval of time values [ms].
inline std::string interval_string(double lo, double hi) {
    return fmt::format("[{}, {}] ms", lo, hi);
}

} // namespace util
} // namespace wslfp
