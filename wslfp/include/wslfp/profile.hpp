#pragma once

// Amplitude profiles map the geometric relation between a current source and
// a recording electrode (distance and orientation angle) to a scalar weight.

#include <memory>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include <wslfp/dense_matrix.hpp>
#include <wslfp/export.hpp>

namespace wslfp {

// Digitised calibration data: amplitude as a function of radial distance
// from the source axis (first axis, starting at 0 µm) and signed depth along
// the source orientation (second axis) [µm].
//
// Evaluation is bilinear inside the grid and zero outside it.
class WSLFP_SYMBOL_VISIBLE calibration_table {
public:
    // Amplitudes are row-major with one row per radius value.
    calibration_table(std::vector<double> radius, std::vector<double> depth, std::vector<double> amplitude);

    double operator()(double radius, double depth) const;

    const std::vector<double>& radius() const { return radius_; }
    const std::vector<double>& depth() const { return depth_; }
    const dense_matrix<double>& amplitude() const { return amplitude_; }

private:
    std::vector<double> radius_;
    std::vector<double> depth_;
    dense_matrix<double> amplitude_;
};

// Closed-form dipole approximation (Aussel et al. 2018):
//
//     amplitude = L cos θ / (4π σ d²)
//
// with dipole length L [µm] and extracellular conductivity σ [S/m].
struct WSLFP_SYMBOL_VISIBLE aussel_profile {
    explicit aussel_profile(double dipole_length = 250, double conductivity = 0.3);

    double evaluate(double distance, double cos_angle) const;

    double dipole_length; // [µm]
    double conductivity;  // [S/m]
};

enum class mazzoni_variant {
    population, // table for a whole population within a small cylinder
    neuron      // table rescaled for use with individual neurons
};

// Table-backed profile (Mazzoni, Lindén et al. 2015).
struct WSLFP_SYMBOL_VISIBLE mazzoni_profile {
    mazzoni_profile(mazzoni_variant variant, std::shared_ptr<const calibration_table> table);

    double evaluate(double distance, double cos_angle) const;

    mazzoni_variant variant;
    std::shared_ptr<const calibration_table> table;
};

using amplitude_profile = std::variant<mazzoni_profile, aussel_profile>;

// Inputs for constructing a profile by name.
struct profile_parameters {
    double dipole_length = 250; // [µm]
    double conductivity = 0.3;  // [S/m]
    std::shared_ptr<const calibration_table> population_table;
    std::shared_ptr<const calibration_table> neuron_table;
};

// Recognised names: "mazzoni_pop", "mazzoni_nrn", "aussel", and the
// aliases "mazzoni15_pop", "mazzoni15_nrn", "aussel18".
// No calibration data is built in: the Mazzoni profiles take their table
// from params (see wslfpio::load_calibration_table) and throw
// missing_calibration_table if it is null. Unrecognised names throw
// unknown_profile.
WSLFP_API amplitude_profile make_profile(const std::string& name, const profile_parameters& params = {});

WSLFP_API std::string profile_name(const amplitude_profile&);

// True if the profile is undefined at zero source-electrode distance.
WSLFP_API bool divides_by_distance(const amplitude_profile&);

WSLFP_API double evaluate(const amplitude_profile&, double distance, double cos_angle);

// Element-wise evaluation over arrays of equal length.
WSLFP_API std::vector<double> evaluate(const amplitude_profile&,
                                      std::span<const double> distance,
                                      std::span<const double> cos_angle);

} // namespace wslfp
