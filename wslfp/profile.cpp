#include <algorithm>
#include <cmath>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <wslfp/math.hpp>
#include <wslfp/profile.hpp>
#include <wslfp/wslfpexcept.hpp>

#include "util/strprintf.hpp"

namespace wslfp {

namespace {

bool strictly_increasing(const std::vector<double>& v) {
    return std::adjacent_find(v.begin(), v.end(), [](double a, double b) { return !(a<b); })==v.end();
}

bool all_finite(const std::vector<double>& v) {
    return std::all_of(v.begin(), v.end(), [](double x) { return std::isfinite(x); });
}

// Locate x in a sorted axis: the index of the lower grid point of the
// enclosing cell and the relative position within that cell.
std::pair<std::size_t, double> locate(const std::vector<double>& axis, double x) {
    if (axis.size()==1) return {0, 0.};

    auto i = std::upper_bound(axis.begin(), axis.end(), x) - axis.begin();
    std::size_t lo = std::min<std::size_t>(i>0? i-1: 0, axis.size()-2);
    return {lo, (x-axis[lo])/(axis[lo+1]-axis[lo])};
}

} // anonymous namespace

calibration_table::calibration_table(std::vector<double> radius, std::vector<double> depth, std::vector<double> amplitude):
    radius_(std::move(radius)), depth_(std::move(depth))
{
    using util::pprintf;

    if (radius_.empty() || depth_.empty()) {
        throw bad_calibration_table("radius and depth axes must be non-empty");
    }
    if (!all_finite(radius_) || !all_finite(depth_) || !all_finite(amplitude)) {
        throw bad_calibration_table("non-finite value");
    }
    if (!strictly_increasing(radius_)) {
        throw bad_calibration_table("radius axis must be strictly increasing");
    }
    if (!strictly_increasing(depth_)) {
        throw bad_calibration_table("depth axis must be strictly increasing");
    }
    if (radius_.front()!=0) {
        throw bad_calibration_table(pprintf("radius axis must start at 0 µm, got {}", radius_.front()));
    }
    if (amplitude.size()!=radius_.size()*depth_.size()) {
        throw bad_calibration_table(pprintf("{} amplitude values for a {}×{} grid",
                                            amplitude.size(), radius_.size(), depth_.size()));
    }
    amplitude_ = dense_matrix<double>(radius_.size(), depth_.size(), std::move(amplitude));
}

double calibration_table::operator()(double r, double h) const {
    if (!(r>=radius_.front() && r<=radius_.back() && h>=depth_.front() && h<=depth_.back())) {
        return 0;
    }

    auto [i, u] = locate(radius_, r);
    auto [j, v] = locate(depth_, h);

    auto at = [this](std::size_t i, std::size_t j) {
        return amplitude_(std::min(i, amplitude_.rows()-1), std::min(j, amplitude_.cols()-1));
    };

    double lo = math::lerp(at(i, j), at(i, j+1), v);
    double hi = math::lerp(at(i+1, j), at(i+1, j+1), v);
    return math::lerp(lo, hi, u);
}

aussel_profile::aussel_profile(double dipole_length, double conductivity):
    dipole_length(dipole_length), conductivity(conductivity)
{
    if (!(std::isfinite(dipole_length) && dipole_length>0)) {
        throw bad_profile_parameter("dipole_length", dipole_length);
    }
    if (!(std::isfinite(conductivity) && conductivity>0)) {
        throw bad_profile_parameter("conductivity", conductivity);
    }
}

double aussel_profile::evaluate(double distance, double cos_angle) const {
    if (!(distance>0)) {
        throw domain_error(util::pprintf("Aussel amplitude undefined at distance {} µm", distance));
    }
    return dipole_length*cos_angle/(4*math::pi<double>*conductivity*math::square(distance));
}

mazzoni_profile::mazzoni_profile(mazzoni_variant variant, std::shared_ptr<const calibration_table> table):
    variant(variant), table(std::move(table))
{
    if (!this->table) {
        throw missing_calibration_table(variant==mazzoni_variant::population? "mazzoni_pop": "mazzoni_nrn");
    }
}

double mazzoni_profile::evaluate(double distance, double cos_angle) const {
    double radial = distance*std::sqrt(std::max(0., 1-math::square(cos_angle)));
    double depth = distance*cos_angle;
    return (*table)(radial, depth);
}

amplitude_profile make_profile(const std::string& name, const profile_parameters& params) {
    if (name=="mazzoni_pop" || name=="mazzoni15_pop") {
        return mazzoni_profile(mazzoni_variant::population, params.population_table);
    }
    if (name=="mazzoni_nrn" || name=="mazzoni15_nrn") {
        return mazzoni_profile(mazzoni_variant::neuron, params.neuron_table);
    }
    if (name=="aussel" || name=="aussel18") {
        return aussel_profile(params.dipole_length, params.conductivity);
    }
    throw unknown_profile(name);
}

std::string profile_name(const amplitude_profile& profile) {
    if (auto p = std::get_if<mazzoni_profile>(&profile)) {
        return p->variant==mazzoni_variant::population? "mazzoni_pop": "mazzoni_nrn";
    }
    return "aussel";
}

bool divides_by_distance(const amplitude_profile& profile) {
    return std::holds_alternative<aussel_profile>(profile);
}

double evaluate(const amplitude_profile& profile, double distance, double cos_angle) {
    return std::visit([&](const auto& p) { return p.evaluate(distance, cos_angle); }, profile);
}

std::vector<double> evaluate(const amplitude_profile& profile,
                             std::span<const double> distance,
                             std::span<const double> cos_angle)
{
    if (distance.size()!=cos_angle.size()) {
        throw domain_error(util::pprintf("{} distances but {} angle cosines", distance.size(), cos_angle.size()));
    }

    std::vector<double> out(distance.size());
    std::visit(
        [&](const auto& p) {
            for (std::size_t i = 0; i<out.size(); ++i) {
                out[i] = p.evaluate(distance[i], cos_angle[i]);
            }
        },
        profile);
    return out;
}

} // namespace wslfp
