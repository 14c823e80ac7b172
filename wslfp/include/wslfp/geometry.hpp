#pragma once

#include <vector>

#include <wslfp/common_types.hpp>
#include <wslfp/dense_matrix.hpp>
#include <wslfp/export.hpp>
#include <wslfp/profile.hpp>

namespace wslfp {

struct geometry_parameters {
    // Either one orientation shared by all sources, or one per source.
    // Only the direction matters.
    point_list orientation = {orientation_up};

    // If set, source coordinates are somata and are shifted by soma_offset
    // along their orientation to obtain the dipole centre. The offset is
    // independent of the profile: changing the Aussel dipole length does
    // not change it.
    bool source_coords_are_somata = true;
    double soma_offset = 125; // [µm]
};

// Convert rows of (x, y, z) values to points; throws bad_coordinate_shape if
// a row does not have exactly three entries.
WSLFP_API point_list to_points(const std::vector<std::vector<double>>& rows, const char* what = "coordinates");

// Orientation for each source after broadcasting, normalised to unit length.
WSLFP_API point_list source_orientations(const point_list& orientation, size_type num_sources);

// Positions used for distance and angle calculations: the dipole centres
// when coordinates are somata, else the coordinates themselves.
WSLFP_API point_list effective_source_positions(const point_list& sources, const geometry_parameters& geom);

// Amplitude weights of shape (num_sources × num_electrodes).
WSLFP_API amplitude_matrix compute_amplitude_matrix(const point_list& sources,
                                                   const point_list& electrodes,
                                                   const amplitude_profile& profile,
                                                   const geometry_parameters& geom = {});

} // namespace wslfp
