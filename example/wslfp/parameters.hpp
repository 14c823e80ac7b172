#pragma once

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include <wslfpio/json_helpers.hpp>

struct demo_params {
    demo_params() = default;

    std::string name = "default";
    unsigned seed = 42;

    // Recording: a linear probe along z.
    unsigned num_electrodes = 8;
    double electrode_spacing = 100;     // [µm]

    // Sources are placed uniformly in a cylinder around the probe.
    unsigned num_sources = 200;
    double column_radius = 250;         // [µm]
    double column_height = 400;         // [µm]

    // Presynaptic populations driving the sources.
    unsigned num_exc = 400;
    unsigned num_inh = 100;
    double rate_exc = 5;                // [Hz]
    double rate_inh = 10;               // [Hz]
    double connection_prob = 0.1;
    double weight_exc = 1;
    double weight_inh = 4;

    double duration = 500;              // [ms]
    double dt = 1;                      // [ms]

    // Amplitude profile: "aussel", "mazzoni_pop" or "mazzoni_nrn".
    nlohmann::json profile = {{"name", "aussel"}};
    std::string calibration_table;      // path, required for Mazzoni profiles

    nlohmann::json calculator = nlohmann::json::object();
    nlohmann::json geometry = nlohmann::json::object();
};

inline demo_params read_options(int argc, char** argv) {
    using wslfpio::param_from_json;

    demo_params params;
    if (argc<2) {
        std::cerr << "Using default parameters.\n";
        return params;
    }
    if (argc>2) {
        throw std::runtime_error("More than one command line option is not permitted.");
    }

    std::string fname = argv[1];
    std::cerr << "Loading parameters from file: " << fname << "\n";
    std::ifstream f(fname);

    if (!f.good()) {
        throw std::runtime_error("Unable to open input parameter file: "+fname);
    }

    nlohmann::json json;
    f >> json;

    param_from_json(params.name, "name", json);
    param_from_json(params.seed, "seed", json);
    param_from_json(params.num_electrodes, "num-electrodes", json);
    param_from_json(params.electrode_spacing, "electrode-spacing-um", json);
    param_from_json(params.num_sources, "num-sources", json);
    param_from_json(params.column_radius, "column-radius-um", json);
    param_from_json(params.column_height, "column-height-um", json);
    param_from_json(params.num_exc, "num-exc", json);
    param_from_json(params.num_inh, "num-inh", json);
    param_from_json(params.rate_exc, "rate-exc-Hz", json);
    param_from_json(params.rate_inh, "rate-inh-Hz", json);
    param_from_json(params.connection_prob, "connection-prob", json);
    param_from_json(params.weight_exc, "weight-exc", json);
    param_from_json(params.weight_inh, "weight-inh", json);
    param_from_json(params.duration, "duration-ms", json);
    param_from_json(params.dt, "dt-ms", json);
    param_from_json(params.profile, "profile", json);
    param_from_json(params.calibration_table, "calibration-table", json);
    param_from_json(params.calculator, "calculator", json);
    param_from_json(params.geometry, "geometry", json);

    if (!json.empty()) {
        for (auto it=json.begin(); it!=json.end(); ++it) {
            std::cerr << "  Warning: unused input parameter: \"" << it.key() << "\"\n";
        }
        std::cerr << "\n";
    }

    return params;
}
