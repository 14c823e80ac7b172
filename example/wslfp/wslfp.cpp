#include <cmath>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

#include <wslfp/calculator.hpp>
#include <wslfp/connectivity.hpp>
#include <wslfp/geometry.hpp>
#include <wslfp/math.hpp>
#include <wslfp/synthesis.hpp>
#include <wslfp/wslfpexcept.hpp>

#include <wslfpio/jsonio.hpp>

#include "parameters.hpp"

using wslfp::index_type;
using wslfp::time_type;

namespace {

struct spike_train {
    std::vector<time_type> times;
    std::vector<index_type> sources;
};

// Independent Poisson spike trains for n neurons at the given rate [Hz].
spike_train poisson_spikes(unsigned n, double rate_Hz, double duration_ms, std::mt19937_64& rng) {
    spike_train s;
    if (rate_Hz<=0) return s;
    std::exponential_distribution<double> isi(rate_Hz*1e-3);
    for (index_type i = 0; i<n; ++i) {
        for (double t = isi(rng); t<duration_ms; t += isi(rng)) {
            s.times.push_back(t);
            s.sources.push_back(i);
        }
    }
    return s;
}

wslfp::sparse_connectivity random_connectivity(unsigned n_pre, unsigned n_post, double p, double w, std::mt19937_64& rng) {
    std::bernoulli_distribution connect(p);
    std::vector<wslfp::connection_entry> entries;
    for (index_type i = 0; i<n_pre; ++i) {
        for (index_type j = 0; j<n_post; ++j) {
            if (connect(rng)) entries.push_back({i, j, w});
        }
    }
    return wslfp::sparse_connectivity::from_entries(n_pre, n_post, std::move(entries));
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto params = read_options(argc, argv);
        std::mt19937_64 rng(params.seed);

        // Electrodes along z through the centre of the column.
        wslfp::point_list electrodes;
        for (unsigned i = 0; i<params.num_electrodes; ++i) {
            electrodes.push_back({0, 0, params.column_height/2 - i*params.electrode_spacing});
        }

        // Somata uniformly distributed in the column.
        std::uniform_real_distribution<double> unit(0, 1);
        wslfp::point_list sources;
        for (unsigned i = 0; i<params.num_sources; ++i) {
            double r = params.column_radius*std::sqrt(unit(rng));
            double phi = 2*wslfp::math::pi<double>*unit(rng);
            double z = params.column_height*(unit(rng)-0.5);
            sources.push_back({r*std::cos(phi), r*std::sin(phi), z});
        }

        wslfp::profile_parameters tables;
        if (!params.calibration_table.empty()) {
            std::ifstream f(params.calibration_table);
            if (!f.good()) {
                throw std::runtime_error("Unable to open calibration table: "+params.calibration_table);
            }
            auto table = wslfpio::load_calibration_table(f);
            tables.population_table = table;
            tables.neuron_table = table;
        }

        auto profile = wslfpio::load_profile(params.profile, tables);
        auto geom = wslfpio::load_geometry_parameters(params.geometry);
        auto calc_params = wslfpio::load_calculator_parameters(params.calculator);

        auto calc = wslfp::wslfp_calculator::from_coordinates(electrodes, sources, profile, geom, calc_params);

        // Synaptic currents onto the sources from excitatory and inhibitory populations.
        std::vector<time_type> t_eval;
        for (time_type t = 0; t<params.duration; t += params.dt) t_eval.push_back(t);

        auto exc = poisson_spikes(params.num_exc, params.rate_exc, params.duration, rng);
        auto inh = poisson_spikes(params.num_inh, params.rate_inh, params.duration, rng);
        auto J_exc = random_connectivity(params.num_exc, params.num_sources, params.connection_prob, params.weight_exc, rng);
        auto J_inh = random_connectivity(params.num_inh, params.num_sources, params.connection_prob, params.weight_inh, rng);

        wslfp::biexp_synapse ampa{0.4, 2, 1};
        wslfp::biexp_synapse gaba{0.25, 5, 1};

        auto I_ampa = wslfp::spikes_to_biexp_currents(t_eval, exc.times, exc.sources, J_exc, ampa);
        auto I_gaba = wslfp::spikes_to_biexp_currents(t_eval, inh.times, inh.sources, J_inh, gaba);

        // Evaluate after the AMPA lag so that the lookback lies inside the recorded window.
        std::vector<time_type> t_lfp;
        for (auto t: t_eval) {
            if (t>=calc_params.tau_ampa) t_lfp.push_back(t);
        }

        auto result = calc.calculate(t_lfp, t_eval, std::move(I_ampa), t_eval, std::move(I_gaba));

        // Standard output carries only the JSON document.
        for (const auto& d: result.diagnostics) {
            std::cerr << "  Warning: " << d << "\n";
        }

        nlohmann::json json;
        json["name"] = params.name;
        json["profile"] = wslfp::profile_name(profile);
        json["calculator"] = wslfpio::write_json(calc.parameters());
        json["geometry"] = wslfpio::write_json(geom);
        json["extracellular potential"] = wslfpio::write_json(result, t_lfp);
        json["extracellular potential"]["unit"] = "a.u.";
        json["spikes"]["exc"] = exc.times.size();
        json["spikes"]["inh"] = inh.times.size();

        std::cout << json << "\n";
    }
    catch (wslfp::wslfp_exception& e) {
        std::cerr << "wslfp error: " << e.what() << "\n";
        return 1;
    }
    catch (std::exception& e) {
        std::cerr << "exception caught: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
