#include <istream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <wslfp/calculator.hpp>
#include <wslfp/geometry.hpp>
#include <wslfp/profile.hpp>

#include <wslfpio/json_helpers.hpp>
#include <wslfpio/jsonio.hpp>

namespace wslfpio {

jsonio_error::jsonio_error(const std::string& msg):
    wslfp_exception(msg) {}

jsonio_unused_input::jsonio_unused_input(const std::string& key):
    jsonio_error("Unused input parameter: \"" + key + "\"")
{}

jsonio_missing_field::jsonio_missing_field(const std::string& field):
    jsonio_error("Missing field: \"" + field + "\"")
{}

jsonio_version_error::jsonio_version_error(const unsigned version):
    jsonio_error("Unsupported version " + std::to_string(version) +
                 ", expected " + std::to_string(WSLFPIO_JSON_VERSION))
{}

jsonio_type_error::jsonio_type_error(const std::string& type):
    jsonio_error("Unexpected document type \"" + type + "\"")
{}

jsonio_value_error::jsonio_value_error(const std::string& field, const std::string& err):
    jsonio_error("Bad value for \"" + field + "\": " + err)
{}

namespace {

void throw_if_not_empty(const nlohmann::json& json) {
    if (!json.empty()) {
        throw jsonio_unused_input(json.begin().key());
    }
}

// find_and_remove_json, reporting conversion failures as jsonio errors.
template <typename T>
std::optional<T> take(const char* name, nlohmann::json& j) {
    try {
        return find_and_remove_json<T>(name, j);
    }
    catch (nlohmann::json::exception& e) {
        throw jsonio_value_error(name, e.what());
    }
}

template <typename T>
T take_required(const char* name, nlohmann::json& j) {
    auto v = take<T>(name, j);
    if (!v) throw jsonio_missing_field(name);
    return std::move(*v);
}

template <typename T>
void take_param(T& x, const char* name, nlohmann::json& j) {
    if (auto v = take<T>(name, j)) x = std::move(*v);
}

nlohmann::json as_object(const nlohmann::json& j, const char* what) {
    if (!j.is_object()) throw jsonio_value_error(what, "expected a JSON object");
    return j;
}

nlohmann::json point_rows(const wslfp::point_list& pts) {
    auto rows = nlohmann::json::array();
    for (const auto& p: pts) rows.push_back({p.x, p.y, p.z});
    return rows;
}

} // anonymous namespace

wslfp::point_list load_points(const nlohmann::json& j, const char* what) {
    std::vector<std::vector<double>> rows;
    try {
        rows = j.get<std::vector<std::vector<double>>>();
    }
    catch (nlohmann::json::exception& e) {
        throw jsonio_value_error(what, e.what());
    }
    return wslfp::to_points(rows, what);
}

std::shared_ptr<const wslfp::calibration_table> load_calibration_table(const nlohmann::json& json) {
    auto j = as_object(json, "calibration table");

    auto version = take_required<unsigned>("version", j);
    auto type = take_required<std::string>("type", j);
    auto data = take_required<nlohmann::json>("data", j);
    throw_if_not_empty(j);

    if (version!=WSLFPIO_JSON_VERSION) throw jsonio_version_error(version);
    if (type!="mazzoni-calibration") throw jsonio_type_error(type);

    data = as_object(data, "data");
    auto radius = take_required<std::vector<double>>("radius-um", data);
    auto depth = take_required<std::vector<double>>("depth-um", data);
    auto rows = take_required<std::vector<std::vector<double>>>("amplitude", data);
    throw_if_not_empty(data);

    std::vector<double> amplitude;
    amplitude.reserve(radius.size()*depth.size());
    for (const auto& r: rows) {
        if (r.size()!=depth.size()) {
            throw jsonio_value_error("amplitude", "each row must have one value per depth");
        }
        amplitude.insert(amplitude.end(), r.begin(), r.end());
    }

    return std::make_shared<const wslfp::calibration_table>(std::move(radius), std::move(depth), std::move(amplitude));
}

std::shared_ptr<const wslfp::calibration_table> load_calibration_table(std::istream& in) {
    nlohmann::json j;
    try {
        in >> j;
    }
    catch (nlohmann::json::exception& e) {
        throw jsonio_error(std::string("Calibration table: ") + e.what());
    }
    return load_calibration_table(j);
}

nlohmann::json write_json(const wslfp::calibration_table& table) {
    nlohmann::json j;
    j["version"] = WSLFPIO_JSON_VERSION;
    j["type"] = "mazzoni-calibration";
    j["data"]["radius-um"] = table.radius();
    j["data"]["depth-um"] = table.depth();

    auto rows = nlohmann::json::array();
    const auto& a = table.amplitude();
    for (std::size_t i = 0; i<a.rows(); ++i) {
        auto r = a.row(i);
        rows.push_back(std::vector<double>(r.begin(), r.end()));
    }
    j["data"]["amplitude"] = std::move(rows);
    return j;
}

wslfp::calculator_parameters load_calculator_parameters(const nlohmann::json& json) {
    auto j = as_object(json, "calculator parameters");

    wslfp::calculator_parameters p;
    take_param(p.alpha, "alpha", j);
    take_param(p.tau_ampa, "tau-ampa-ms", j);
    take_param(p.tau_gaba, "tau-gaba-ms", j);
    take_param(p.strict_boundaries, "strict-boundaries", j);
    throw_if_not_empty(j);
    return p;
}

wslfp::geometry_parameters load_geometry_parameters(const nlohmann::json& json) {
    auto j = as_object(json, "geometry parameters");

    wslfp::geometry_parameters g;
    if (auto o = take<nlohmann::json>("orientation", j)) {
        g.orientation = load_points(*o, "orientation");
    }
    take_param(g.source_coords_are_somata, "source-coords-are-somata", j);
    take_param(g.soma_offset, "soma-offset-um", j);
    throw_if_not_empty(j);
    return g;
}

wslfp::amplitude_profile load_profile(const nlohmann::json& json, const wslfp::profile_parameters& tables) {
    auto j = as_object(json, "profile");

    auto name = take_required<std::string>("name", j);
    wslfp::profile_parameters p = tables;
    take_param(p.dipole_length, "dipole-length-um", j);
    take_param(p.conductivity, "conductivity-S-per-m", j);
    throw_if_not_empty(j);

    return wslfp::make_profile(name, p);
}

nlohmann::json write_json(const wslfp::calculator_parameters& p) {
    nlohmann::json j;
    j["alpha"] = p.alpha;
    j["tau-ampa-ms"] = p.tau_ampa;
    j["tau-gaba-ms"] = p.tau_gaba;
    j["strict-boundaries"] = p.strict_boundaries;
    return j;
}

nlohmann::json write_json(const wslfp::geometry_parameters& g) {
    nlohmann::json j;
    j["orientation"] = point_rows(g.orientation);
    j["source-coords-are-somata"] = g.source_coords_are_somata;
    j["soma-offset-um"] = g.soma_offset;
    return j;
}

nlohmann::json write_json(const wslfp::lfp_result& result, std::span<const wslfp::time_type> times) {
    nlohmann::json j;
    const auto& lfp = result.lfp;

    // One trace per electrode.
    std::vector<std::vector<double>> per_electrode(lfp.cols(), std::vector<double>(lfp.rows()));
    for (std::size_t k = 0; k<lfp.rows(); ++k) {
        for (std::size_t e = 0; e<lfp.cols(); ++e) {
            per_electrode[e][k] = lfp(k, e);
        }
    }

    j["time"] = std::vector<double>(times.begin(), times.end());
    j["lfp"] = per_electrode;

    auto diags = nlohmann::json::array();
    for (const auto& d: result.diagnostics) {
        nlohmann::json dj;
        dj["kind"] = wslfp::to_string(d.kind);
        dj["trace"] = d.trace;
        dj["message"] = d.message;
        dj["requested"] = {d.requested_min, d.requested_max};
        dj["available"] = {d.available_min, d.available_max};
        dj["count"] = d.count;
        diags.push_back(std::move(dj));
    }
    j["diagnostics"] = std::move(diags);
    return j;
}

} // namespace wslfpio
