#include <string>

#include <wslfp/wslfpexcept.hpp>

#include "util/strprintf.hpp"

namespace wslfp {

using util::pprintf;

wslfp_exception::wslfp_exception(const std::string& what):
    std::runtime_error{what}
{}

domain_error::domain_error(const std::string& w): wslfp_exception(w) {}

unknown_profile::unknown_profile(const std::string& name):
    wslfp_exception(pprintf("unknown amplitude profile \"{}\"; expected one of mazzoni_pop, mazzoni_nrn, aussel", name)),
    name(name)
{}

missing_calibration_table::missing_calibration_table(const std::string& profile):
    wslfp_exception(pprintf("amplitude profile {} requires a calibration table", profile)),
    profile(profile)
{}

bad_calibration_table::bad_calibration_table(const std::string& reason):
    wslfp_exception(pprintf("invalid calibration table: {}", reason))
{}

bad_profile_parameter::bad_profile_parameter(const std::string& parameter, double value):
    wslfp_exception(pprintf("amplitude profile parameter {} must be positive and finite, got {}", parameter, value)),
    parameter(parameter),
    value(value)
{}

bad_coordinate_shape::bad_coordinate_shape(const std::string& what, std::size_t row, std::size_t width):
    wslfp_exception(pprintf("{} must have shape (N, 3): row {} has {} entries", what, row, width)),
    coordinates(what),
    row(row),
    width(width)
{}

empty_coordinates::empty_coordinates(const std::string& what):
    wslfp_exception(pprintf("{} must contain at least one point", what)),
    coordinates(what)
{}

bad_orientation_count::bad_orientation_count(std::size_t count, size_type num_sources):
    wslfp_exception(pprintf("{} orientation vectors cannot be broadcast to {} sources", count, num_sources)),
    count(count),
    num_sources(num_sources)
{}

zero_orientation::zero_orientation(index_type source):
    wslfp_exception(pprintf("orientation of source {} has zero length", source)),
    source(source)
{}

zero_source_distance::zero_source_distance(index_type source, index_type electrode):
    wslfp_exception(pprintf("source {} coincides with electrode {}: amplitude undefined at zero distance", source, electrode)),
    source(source),
    electrode(electrode)
{}

bad_calculator_parameter::bad_calculator_parameter(const std::string& parameter, double value):
    wslfp_exception(pprintf("calculator parameter {} must be finite, got {}", parameter, value)),
    parameter(parameter),
    value(value)
{}

bad_time_axis::bad_time_axis(const std::string& trace, const std::string& reason):
    wslfp_exception(pprintf("{} time axis: {}", trace, reason)),
    trace(trace)
{}

bad_current_shape::bad_current_shape(const std::string& trace, std::size_t rows, std::size_t cols,
                                     std::size_t expected_rows, std::size_t expected_cols):
    wslfp_exception(pprintf("{} currents have shape ({}, {}), expected ({}, {})",
                            trace, rows, cols, expected_rows, expected_cols)),
    trace(trace),
    rows(rows), cols(cols),
    expected_rows(expected_rows), expected_cols(expected_cols)
{}

bad_amplitude_shape::bad_amplitude_shape(std::size_t sources, std::size_t electrodes):
    wslfp_exception(pprintf("amplitude matrix of shape ({}, {}) must have at least one source and one electrode",
                            sources, electrodes)),
    sources(sources),
    electrodes(electrodes)
{}

out_of_range_times::out_of_range_times(const std::string& trace,
                                       time_type requested_min, time_type requested_max,
                                       time_type available_min, time_type available_max):
    wslfp_exception(pprintf("{} currents requested over {} but only available over {}",
                            trace,
                            util::interval_string(requested_min, requested_max),
                            util::interval_string(available_min, available_max))),
    trace(trace),
    requested_min(requested_min), requested_max(requested_max),
    available_min(available_min), available_max(available_max)
{}

bad_connectivity::bad_connectivity(const std::string& reason):
    wslfp_exception(pprintf("invalid connectivity: {}", reason))
{}

bad_spike_source::bad_spike_source(std::size_t spike, index_type source, size_type num_sources):
    wslfp_exception(pprintf("spike {} has source index {}, but connectivity has only {} sources",
                            spike, source, num_sources)),
    spike(spike),
    source(source),
    num_sources(num_sources)
{}

spike_count_mismatch::spike_count_mismatch(std::size_t num_times, std::size_t num_sources):
    wslfp_exception(pprintf("{} spike times but {} spike source indices", num_times, num_sources)),
    num_times(num_times),
    num_sources(num_sources)
{}

bad_synapse_parameter::bad_synapse_parameter(const std::string& parameter, double value, const std::string& constraint):
    wslfp_exception(pprintf("synapse parameter {}={} violates {}", parameter, value, constraint)),
    parameter(parameter),
    value(value)
{}

} // namespace wslfp
