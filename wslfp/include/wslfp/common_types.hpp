#pragma once

// Common definitions for index types and geometric primitives used
// throughout the library.

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <vector>

#include <wslfp/export.hpp>

namespace wslfp {

// Time values are in milliseconds.
using time_type = double;

// Index of a current source, electrode, or synaptic target.
using index_type = std::uint32_t;

// Sizes of collections of sources, electrodes, and targets.
using size_type = std::uint32_t;

// A point or direction in 3-d space [µm].
struct WSLFP_SYMBOL_VISIBLE point {
    double x = 0, y = 0, z = 0;

    auto operator<=>(const point&) const = default;
    friend std::ostream& operator<<(std::ostream&, const point&);
};

using point_list = std::vector<point>;

WSLFP_API point operator+(const point& a, const point& b);
WSLFP_API point operator-(const point& a, const point& b);
WSLFP_API point operator*(double s, const point& p);

WSLFP_API double dot(const point& a, const point& b);
WSLFP_API double norm(const point& p);

// Default source orientation: apical axis pointing up the z axis.
constexpr point orientation_up{0, 0, 1};

} // namespace wslfp
