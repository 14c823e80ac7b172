#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

#include <wslfp/common_types.hpp>
#include <wslfp/export.hpp>

// WSLFP-specific exception hierarchy.

namespace wslfp {

// Common base-class for wslfp run-time errors.

struct WSLFP_SYMBOL_VISIBLE wslfp_exception: std::runtime_error {
    wslfp_exception(const std::string&);
};

// Argument violates domain constraints, eg division by a zero distance.
struct WSLFP_SYMBOL_VISIBLE domain_error: wslfp_exception {
    domain_error(const std::string&);
};

// Amplitude profile errors:

struct WSLFP_SYMBOL_VISIBLE unknown_profile: wslfp_exception {
    explicit unknown_profile(const std::string& name);
    std::string name;
};

struct WSLFP_SYMBOL_VISIBLE missing_calibration_table: wslfp_exception {
    explicit missing_calibration_table(const std::string& profile);
    std::string profile;
};

struct WSLFP_SYMBOL_VISIBLE bad_calibration_table: wslfp_exception {
    explicit bad_calibration_table(const std::string& reason);
};

struct WSLFP_SYMBOL_VISIBLE bad_profile_parameter: wslfp_exception {
    bad_profile_parameter(const std::string& parameter, double value);
    std::string parameter;
    double value;
};

// Geometry errors:

struct WSLFP_SYMBOL_VISIBLE bad_coordinate_shape: wslfp_exception {
    bad_coordinate_shape(const std::string& what, std::size_t row, std::size_t width);
    std::string coordinates;
    std::size_t row;
    std::size_t width;
};

struct WSLFP_SYMBOL_VISIBLE empty_coordinates: wslfp_exception {
    explicit empty_coordinates(const std::string& what);
    std::string coordinates;
};

struct WSLFP_SYMBOL_VISIBLE bad_orientation_count: wslfp_exception {
    bad_orientation_count(std::size_t count, size_type num_sources);
    std::size_t count;
    size_type num_sources;
};

struct WSLFP_SYMBOL_VISIBLE zero_orientation: wslfp_exception {
    explicit zero_orientation(index_type source);
    index_type source;
};

struct WSLFP_SYMBOL_VISIBLE zero_source_distance: wslfp_exception {
    zero_source_distance(index_type source, index_type electrode);
    index_type source;
    index_type electrode;
};

// Calculator and alignment errors:

struct WSLFP_SYMBOL_VISIBLE bad_calculator_parameter: wslfp_exception {
    bad_calculator_parameter(const std::string& parameter, double value);
    std::string parameter;
    double value;
};

struct WSLFP_SYMBOL_VISIBLE bad_time_axis: wslfp_exception {
    bad_time_axis(const std::string& trace, const std::string& reason);
    std::string trace;
};

struct WSLFP_SYMBOL_VISIBLE bad_current_shape: wslfp_exception {
    bad_current_shape(const std::string& trace, std::size_t rows, std::size_t cols,
                      std::size_t expected_rows, std::size_t expected_cols);
    std::string trace;
    std::size_t rows, cols;
    std::size_t expected_rows, expected_cols;
};

struct WSLFP_SYMBOL_VISIBLE bad_amplitude_shape: wslfp_exception {
    bad_amplitude_shape(std::size_t sources, std::size_t electrodes);
    std::size_t sources, electrodes;
};

struct WSLFP_SYMBOL_VISIBLE out_of_range_times: wslfp_exception {
    out_of_range_times(const std::string& trace,
                       time_type requested_min, time_type requested_max,
                       time_type available_min, time_type available_max);
    std::string trace;
    time_type requested_min, requested_max;
    time_type available_min, available_max;
};

// Current synthesis errors:

struct WSLFP_SYMBOL_VISIBLE bad_connectivity: wslfp_exception {
    explicit bad_connectivity(const std::string& reason);
};

struct WSLFP_SYMBOL_VISIBLE bad_spike_source: wslfp_exception {
    bad_spike_source(std::size_t spike, index_type source, size_type num_sources);
    std::size_t spike;
    index_type source;
    size_type num_sources;
};

struct WSLFP_SYMBOL_VISIBLE spike_count_mismatch: wslfp_exception {
    spike_count_mismatch(std::size_t num_times, std::size_t num_sources);
    std::size_t num_times, num_sources;
};

struct WSLFP_SYMBOL_VISIBLE bad_synapse_parameter: wslfp_exception {
    bad_synapse_parameter(const std::string& parameter, double value, const std::string& constraint);
    std::string parameter;
    double value;
};

} // namespace wslfp
