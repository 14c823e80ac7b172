#pragma once

#include <span>
#include <vector>

#include <wslfp/align.hpp>
#include <wslfp/common_types.hpp>
#include <wslfp/dense_matrix.hpp>
#include <wslfp/diagnostic.hpp>
#include <wslfp/export.hpp>
#include <wslfp/geometry.hpp>
#include <wslfp/profile.hpp>

namespace wslfp {

// Reference WSLFP weighting (constant α across depth).
struct calculator_parameters {
    double alpha = 1.65;        // inhibitory scaling
    time_type tau_ampa = 6;     // AMPA lag [ms]
    time_type tau_gaba = 0;     // GABA lag [ms]
    bool strict_boundaries = false;
};

struct WSLFP_SYMBOL_VISIBLE lfp_result {
    sample_matrix lfp;          // (eval time × electrode)
    diagnostic_list diagnostics;
};

// Weighted-sum LFP proxy over a fixed set of sources and electrodes.
//
// The amplitude matrix is computed once and never modified, so a calculator
// may be shared between threads calling calculate() concurrently.
class WSLFP_SYMBOL_VISIBLE wslfp_calculator {
public:
    // Use a precomputed (source × electrode) amplitude matrix.
    explicit wslfp_calculator(amplitude_matrix amplitude, const calculator_parameters& params = {});

    static wslfp_calculator from_coordinates(const point_list& electrodes,
                                             const point_list& sources,
                                             const amplitude_profile& profile,
                                             const geometry_parameters& geom = {},
                                             const calculator_parameters& params = {});

    // LFP at each evaluation time for each electrode, given AMPA and GABA
    // currents with one column per source.
    lfp_result calculate(std::span<const time_type> eval_times,
                         const current_trace& ampa,
                         const current_trace& gaba) const;

    lfp_result calculate(std::span<const time_type> eval_times,
                         std::vector<time_type> ampa_times, sample_matrix ampa_currents,
                         std::vector<time_type> gaba_times, sample_matrix gaba_currents) const;

    size_type num_sources() const { return amplitude_.rows(); }
    size_type num_electrodes() const { return amplitude_.cols(); }

    const amplitude_matrix& amplitude() const { return amplitude_; }
    const calculator_parameters& parameters() const { return params_; }

private:
    amplitude_matrix amplitude_;
    calculator_parameters params_;
};

} // namespace wslfp
