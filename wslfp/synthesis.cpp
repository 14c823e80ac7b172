#include <algorithm>
#include <cmath>
#include <numeric>
#include <span>
#include <utility>
#include <vector>

#include <wslfp/connectivity.hpp>
#include <wslfp/math.hpp>
#include <wslfp/synthesis.hpp>
#include <wslfp/wslfpexcept.hpp>

#include "util/strprintf.hpp"

namespace wslfp {

void validate_synapse(const biexp_synapse& syn) {
    if (!(std::isfinite(syn.tau_rise) && syn.tau_rise>0)) {
        throw bad_synapse_parameter("tau_rise", syn.tau_rise, "0 < tau_rise");
    }
    if (!(std::isfinite(syn.tau_decay) && syn.tau_decay>syn.tau_rise)) {
        throw bad_synapse_parameter("tau_decay", syn.tau_decay, "tau_rise < tau_decay");
    }
    if (!(std::isfinite(syn.delay) && syn.delay>=0)) {
        throw bad_synapse_parameter("delay", syn.delay, "0 <= delay");
    }
}

double biexp_kernel(const biexp_synapse& syn, time_type t) {
    validate_synapse(syn);
    if (t<0) return 0;
    return (std::exp(-t/syn.tau_decay) - std::exp(-t/syn.tau_rise))/math::biexp_peak(syn.tau_rise, syn.tau_decay);
}

// The biexponential kernel is the difference of two exponentially decaying
// traces. Each target keeps one decay and one rise state holding the sum of
// w·exp(-(t - t_arrival)/τ) over arrived spikes at the last evaluation time;
// advancing in time multiplies each state by a single exponential factor, and
// spikes arriving in between are added with their exact partial decay.
sample_matrix spikes_to_biexp_currents(std::span<const time_type> eval_times,
                                       std::span<const time_type> spike_times,
                                       std::span<const index_type> spike_sources,
                                       const sparse_connectivity& connectivity,
                                       const biexp_synapse& syn)
{
    validate_synapse(syn);
    if (spike_times.size()!=spike_sources.size()) {
        throw spike_count_mismatch(spike_times.size(), spike_sources.size());
    }
    for (std::size_t k = 0; k<eval_times.size(); ++k) {
        if (!std::isfinite(eval_times[k])) {
            throw domain_error(util::pprintf("evaluation time {} is not finite: {}", k, eval_times[k]));
        }
    }
    for (std::size_t k = 0; k<spike_sources.size(); ++k) {
        if (spike_sources[k]>=connectivity.num_sources()) {
            throw bad_spike_source(k, spike_sources[k], connectivity.num_sources());
        }
        if (!std::isfinite(spike_times[k])) {
            throw domain_error(util::pprintf("spike {} has non-finite time {}", k, spike_times[k]));
        }
    }

    const auto n_target = connectivity.num_targets();
    const double tau_d = syn.tau_decay;
    const double tau_r = syn.tau_rise;
    const double inv_norm = 1/math::biexp_peak(tau_r, tau_d);

    sample_matrix currents(eval_times.size(), n_target, 0.);
    if (eval_times.empty() || n_target==0) return currents;

    // Spike arrivals at the synapse, in time order.
    std::vector<std::pair<time_type, index_type>> arrivals;
    arrivals.reserve(spike_times.size());
    for (std::size_t k = 0; k<spike_times.size(); ++k) {
        arrivals.emplace_back(spike_times[k]+syn.delay, spike_sources[k]);
    }
    std::sort(arrivals.begin(), arrivals.end());

    std::vector<std::size_t> order(eval_times.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
        [&](std::size_t a, std::size_t b) { return eval_times[a]<eval_times[b]; });

    std::vector<double> state_d(n_target, 0.);
    std::vector<double> state_r(n_target, 0.);
    time_type t_state = eval_times[order.front()];
    std::size_t next = 0;

    for (auto k: order) {
        const time_type t = eval_times[k];

        if (t>t_state) {
            const double decay_d = std::exp(-(t-t_state)/tau_d);
            const double decay_r = std::exp(-(t-t_state)/tau_r);
            for (index_type j = 0; j<n_target; ++j) {
                state_d[j] *= decay_d;
                state_r[j] *= decay_r;
            }
            t_state = t;
        }

        for (; next<arrivals.size() && arrivals[next].first<=t; ++next) {
            const auto [t_arrive, src] = arrivals[next];
            const double ed = std::exp(-(t-t_arrive)/tau_d);
            const double er = std::exp(-(t-t_arrive)/tau_r);
            auto targets = connectivity.targets(src);
            auto weights = connectivity.weights(src);
            for (std::size_t c = 0; c<targets.size(); ++c) {
                state_d[targets[c]] += weights[c]*ed;
                state_r[targets[c]] += weights[c]*er;
            }
        }

        auto out = currents.row(k);
        for (index_type j = 0; j<n_target; ++j) {
            out[j] = (state_d[j]-state_r[j])*inv_norm;
        }
    }
    return currents;
}

} // namespace wslfp
