#pragma once

#include <iosfwd>
#include <memory>
#include <span>
#include <string>

#include <wslfp/calculator.hpp>
#include <wslfp/geometry.hpp>
#include <wslfp/profile.hpp>
#include <wslfp/wslfpexcept.hpp>

#include <nlohmann/json.hpp>

#define WSLFPIO_JSON_VERSION 1

namespace wslfpio {

struct jsonio_error: public wslfp::wslfp_exception {
    jsonio_error(const std::string& msg);
};

// Input in JSON not used
struct jsonio_unused_input: jsonio_error {
    explicit jsonio_unused_input(const std::string& key);
};

struct jsonio_missing_field: jsonio_error {
    explicit jsonio_missing_field(const std::string& field);
};

struct jsonio_version_error: jsonio_error {
    explicit jsonio_version_error(const unsigned version);
};

struct jsonio_type_error: jsonio_error {
    explicit jsonio_type_error(const std::string& type);
};

// A value has the wrong JSON type or shape.
struct jsonio_value_error: jsonio_error {
    jsonio_value_error(const std::string& field, const std::string& err);
};

// Calibration table documents:
//
//   { "version": 1, "type": "mazzoni-calibration",
//     "data": { "radius-um": [...], "depth-um": [...], "amplitude": [[...], ...] } }
//
// with one amplitude row per radius value.
std::shared_ptr<const wslfp::calibration_table> load_calibration_table(const nlohmann::json&);
std::shared_ptr<const wslfp::calibration_table> load_calibration_table(std::istream&);
nlohmann::json write_json(const wslfp::calibration_table&);

// Parameter objects. Keys:
//   calculator: alpha, tau-ampa-ms, tau-gaba-ms, strict-boundaries
//   geometry:   orientation, source-coords-are-somata, soma-offset-um
// Absent keys keep their defaults, unknown keys raise jsonio_unused_input.
wslfp::calculator_parameters load_calculator_parameters(const nlohmann::json&);
wslfp::geometry_parameters load_geometry_parameters(const nlohmann::json&);

// Profile description with a "name" and optional "dipole-length-um" and
// "conductivity-S-per-m"; Mazzoni profiles take their tables from `tables`.
wslfp::amplitude_profile load_profile(const nlohmann::json&, const wslfp::profile_parameters& tables = {});

nlohmann::json write_json(const wslfp::calculator_parameters&);
nlohmann::json write_json(const wslfp::geometry_parameters&);

// Coordinates as a list of [x, y, z] rows.
wslfp::point_list load_points(const nlohmann::json&, const char* what = "coordinates");

// LFP per electrode and diagnostics.
nlohmann::json write_json(const wslfp::lfp_result&, std::span<const wslfp::time_type> times);

} // namespace wslfpio
