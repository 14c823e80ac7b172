#include <ostream>
#include <string>

#include <wslfp/diagnostic.hpp>

#include "util/strprintf.hpp"

namespace wslfp {

const char* to_string(diagnostic_kind k) {
    switch (k) {
    case diagnostic_kind::out_of_range:
        return "out-of-range";
    }
    return "";
}

diagnostic make_out_of_range_diagnostic(const std::string& trace,
                                        time_type requested_min, time_type requested_max,
                                        time_type available_min, time_type available_max,
                                        std::size_t count)
{
    diagnostic d;
    d.kind = diagnostic_kind::out_of_range;
    d.trace = trace;
    d.requested_min = requested_min;
    d.requested_max = requested_max;
    d.available_min = available_min;
    d.available_max = available_max;
    d.count = count;
    d.message = util::pprintf(
        "{} currents requested over {} but only available over {}; {} evaluation time(s) set to zero current",
        trace,
        util::interval_string(requested_min, requested_max),
        util::interval_string(available_min, available_max),
        count);
    return d;
}

std::ostream& operator<<(std::ostream& o, const diagnostic& d) {
    return o << to_string(d.kind) << ": " << d.message;
}

} // namespace wslfp
