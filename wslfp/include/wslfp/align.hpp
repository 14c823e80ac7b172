#pragma once

// Linear interpolation of current traces onto evaluation times.

#include <span>
#include <string>
#include <vector>

#include <wslfp/common_types.hpp>
#include <wslfp/dense_matrix.hpp>
#include <wslfp/diagnostic.hpp>
#include <wslfp/export.hpp>

namespace wslfp {

// A (time × source) matrix of synaptic currents with its own time axis [ms].
struct WSLFP_SYMBOL_VISIBLE current_trace {
    std::vector<time_type> times;
    sample_matrix values;
};

// Throws bad_time_axis or bad_current_shape. A num_sources of zero skips the
// column check.
WSLFP_API void validate_trace(const std::string& name, const current_trace& trace, size_type num_sources = 0);

struct WSLFP_SYMBOL_VISIBLE aligned_currents {
    sample_matrix values;           // (eval time × source)
    diagnostic_list diagnostics;
};

enum class boundary_policy {
    zero_fill,  // out-of-range times give zero current and a diagnostic
    strict      // out-of-range times raise out_of_range_times
};

// Interpolate trace values at each evaluation time. The time axis must be
// strictly increasing; interpolation is inclusive of both end points.
// Non-finite evaluation times raise domain_error.
WSLFP_API aligned_currents align(std::span<const time_type> eval_times,
                                 const current_trace& trace,
                                 const std::string& name = "current",
                                 boundary_policy policy = boundary_policy::zero_fill);

} // namespace wslfp
