#include <cmath>
#include <span>
#include <utility>
#include <vector>

#include <wslfp/align.hpp>
#include <wslfp/calculator.hpp>
#include <wslfp/geometry.hpp>
#include <wslfp/wslfpexcept.hpp>

namespace wslfp {

namespace {

void check_finite(const char* name, double value) {
    if (!std::isfinite(value)) throw bad_calculator_parameter(name, value);
}

std::vector<time_type> lagged(std::span<const time_type> times, time_type lag) {
    std::vector<time_type> shifted(times.begin(), times.end());
    for (auto& t: shifted) t -= lag;
    return shifted;
}

} // anonymous namespace

wslfp_calculator::wslfp_calculator(amplitude_matrix amplitude, const calculator_parameters& params):
    amplitude_(std::move(amplitude)), params_(params)
{
    if (amplitude_.rows()==0 || amplitude_.cols()==0) {
        throw bad_amplitude_shape(amplitude_.rows(), amplitude_.cols());
    }
    check_finite("alpha", params_.alpha);
    check_finite("tau_ampa", params_.tau_ampa);
    check_finite("tau_gaba", params_.tau_gaba);
}

wslfp_calculator wslfp_calculator::from_coordinates(const point_list& electrodes,
                                                    const point_list& sources,
                                                    const amplitude_profile& profile,
                                                    const geometry_parameters& geom,
                                                    const calculator_parameters& params)
{
    return wslfp_calculator(compute_amplitude_matrix(sources, electrodes, profile, geom), params);
}

lfp_result wslfp_calculator::calculate(std::span<const time_type> eval_times,
                                       const current_trace& ampa,
                                       const current_trace& gaba) const
{
    const auto n_src = num_sources();
    const auto n_elec = num_electrodes();

    validate_trace("ampa", ampa, n_src);
    validate_trace("gaba", gaba, n_src);

    auto policy = params_.strict_boundaries? boundary_policy::strict: boundary_policy::zero_fill;

    // Each current type contributes at the evaluation time minus its lag.
    auto I_ampa = align(lagged(eval_times, params_.tau_ampa), ampa, "ampa", policy);
    auto I_gaba = align(lagged(eval_times, params_.tau_gaba), gaba, "gaba", policy);

    lfp_result result;
    result.lfp = sample_matrix(eval_times.size(), n_elec, 0.);
    result.diagnostics = std::move(I_ampa.diagnostics);
    result.diagnostics.insert(result.diagnostics.end(), I_gaba.diagnostics.begin(), I_gaba.diagnostics.end());

    const double alpha = params_.alpha;
    const double scale = 1./n_src;

    for (std::size_t k = 0; k<eval_times.size(); ++k) {
        auto a = I_ampa.values.row(k);
        auto g = I_gaba.values.row(k);
        auto out = result.lfp.row(k);

        for (index_type s = 0; s<n_src; ++s) {
            const double combined = a[s] - alpha*g[s];
            auto w = amplitude_.row(s);
            for (index_type e = 0; e<n_elec; ++e) {
                out[e] += w[e]*combined;
            }
        }
        for (auto& v: out) v *= scale;
    }
    return result;
}

lfp_result wslfp_calculator::calculate(std::span<const time_type> eval_times,
                                       std::vector<time_type> ampa_times, sample_matrix ampa_currents,
                                       std::vector<time_type> gaba_times, sample_matrix gaba_currents) const
{
    return calculate(eval_times,
                     current_trace{std::move(ampa_times), std::move(ampa_currents)},
                     current_trace{std::move(gaba_times), std::move(gaba_currents)});
}

} // namespace wslfp
