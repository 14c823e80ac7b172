#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include <wslfp/common_types.hpp>
#include <wslfp/export.hpp>

namespace wslfp {

enum class diagnostic_kind {
    out_of_range  // evaluation times outside a current trace; zero-filled
};

// A non-fatal condition encountered while computing a result.
struct WSLFP_SYMBOL_VISIBLE diagnostic {
    diagnostic_kind kind = diagnostic_kind::out_of_range;
    std::string trace;          // name of the trace concerned, e.g. "ampa"
    std::string message;
    time_type requested_min = 0, requested_max = 0;
    time_type available_min = 0, available_max = 0;
    std::size_t count = 0;      // number of affected evaluation times

    friend std::ostream& operator<<(std::ostream&, const diagnostic&);
};

using diagnostic_list = std::vector<diagnostic>;

WSLFP_API const char* to_string(diagnostic_kind);

WSLFP_API diagnostic make_out_of_range_diagnostic(const std::string& trace,
                                                  time_type requested_min, time_type requested_max,
                                                  time_type available_min, time_type available_max,
                                                  std::size_t count);

} // namespace wslfp
