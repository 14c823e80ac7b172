#include <algorithm>
#include <cmath>
#include <span>
#include <string>

#include <wslfp/align.hpp>
#include <wslfp/math.hpp>
#include <wslfp/wslfpexcept.hpp>

#include "util/strprintf.hpp"

namespace wslfp {

void validate_trace(const std::string& name, const current_trace& trace, size_type num_sources) {
    const auto& t = trace.times;
    if (t.empty()) {
        throw bad_time_axis(name, "no samples");
    }
    if (!std::all_of(t.begin(), t.end(), [](time_type x) { return std::isfinite(x); })) {
        throw bad_time_axis(name, "non-finite sample time");
    }
    if (std::adjacent_find(t.begin(), t.end(), [](time_type a, time_type b) { return !(a<b); })!=t.end()) {
        throw bad_time_axis(name, "sample times must be strictly increasing");
    }

    const auto& v = trace.values;
    std::size_t expected_cols = num_sources? num_sources: v.cols();
    if (v.rows()!=t.size() || v.cols()!=expected_cols) {
        throw bad_current_shape(name, v.rows(), v.cols(), t.size(), expected_cols);
    }
}

aligned_currents align(std::span<const time_type> eval_times,
                       const current_trace& trace,
                       const std::string& name,
                       boundary_policy policy)
{
    validate_trace(name, trace);

    const auto& times = trace.times;
    const auto& values = trace.values;
    const auto n = values.cols();
    const time_type t_first = times.front();
    const time_type t_last = times.back();

    for (std::size_t k = 0; k<eval_times.size(); ++k) {
        if (!std::isfinite(eval_times[k])) {
            throw domain_error(util::pprintf("{} evaluation time {} is not finite: {}", name, k, eval_times[k]));
        }
    }

    aligned_currents result;
    result.values = sample_matrix(eval_times.size(), n, 0.);

    std::size_t n_out = 0;
    for (std::size_t k = 0; k<eval_times.size(); ++k) {
        const time_type t = eval_times[k];
        if (!(t>=t_first && t<=t_last)) {
            ++n_out;
            continue;
        }

        auto out = result.values.row(k);
        auto i = std::upper_bound(times.begin(), times.end(), t) - times.begin();
        if (std::size_t(i)==times.size()) {
            auto last = values.row(times.size()-1);
            std::copy(last.begin(), last.end(), out.begin());
            continue;
        }

        auto lo = i-1;
        double u = (t-times[lo])/(times[lo+1]-times[lo]);
        auto a = values.row(lo);
        auto b = values.row(lo+1);
        for (std::size_t s = 0; s<n; ++s) {
            out[s] = math::lerp(a[s], b[s], u);
        }
    }

    if (n_out) {
        auto [lo, hi] = std::minmax_element(eval_times.begin(), eval_times.end());
        if (policy==boundary_policy::strict) {
            throw out_of_range_times(name, *lo, *hi, t_first, t_last);
        }
        result.diagnostics.push_back(make_out_of_range_diagnostic(name, *lo, *hi, t_first, t_last, n_out));
    }
    return result;
}

} // namespace wslfp
