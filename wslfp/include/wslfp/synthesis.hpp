#pragma once

// Postsynaptic currents from spike trains, by convolution with a
// normalised biexponential kernel.

#include <span>

#include <wslfp/common_types.hpp>
#include <wslfp/connectivity.hpp>
#include <wslfp/dense_matrix.hpp>
#include <wslfp/export.hpp>

namespace wslfp {

struct biexp_synapse {
    time_type tau_rise = 0.4;   // [ms]
    time_type tau_decay = 2;    // [ms]
    time_type delay = 0;        // [ms]
};

// Throws bad_synapse_parameter unless 0 < tau_rise < tau_decay and delay >= 0.
WSLFP_API void validate_synapse(const biexp_synapse&);

// Value of the kernel for a unit weight spike, t ms after spike arrival;
// zero for t < 0 and peaking at 1.
WSLFP_API double biexp_kernel(const biexp_synapse&, time_type t);

// Currents of shape (eval time × num_targets). A spike of source i at
// time t adds, for each target j, the kernel of weight connectivity(i, j)
// starting at t + delay.
//
// Evaluation and spike times may be given in any order, but must be finite;
// otherwise domain_error is thrown. Cost is
// O(T·num_targets + spikes·fan-out) rather than O(T·spikes).
WSLFP_API sample_matrix spikes_to_biexp_currents(std::span<const time_type> eval_times,
                                                 std::span<const time_type> spike_times,
                                                 std::span<const index_type> spike_sources,
                                                 const sparse_connectivity& connectivity,
                                                 const biexp_synapse& synapse);

} // namespace wslfp
