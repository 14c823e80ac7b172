#include <cmath>
#include <vector>

#include <wslfp/common_types.hpp>
#include <wslfp/geometry.hpp>
#include <wslfp/profile.hpp>
#include <wslfp/wslfpexcept.hpp>

namespace wslfp {

point_list to_points(const std::vector<std::vector<double>>& rows, const char* what) {
    point_list pts;
    pts.reserve(rows.size());
    for (std::size_t i = 0; i<rows.size(); ++i) {
        const auto& r = rows[i];
        if (r.size()!=3) {
            throw bad_coordinate_shape(what, i, r.size());
        }
        pts.push_back({r[0], r[1], r[2]});
    }
    return pts;
}

point_list source_orientations(const point_list& orientation, size_type num_sources) {
    if (orientation.size()!=1 && orientation.size()!=num_sources) {
        throw bad_orientation_count(orientation.size(), num_sources);
    }

    point_list unit;
    unit.reserve(num_sources);
    for (index_type i = 0; i<num_sources; ++i) {
        const point& o = orientation.size()==1? orientation.front(): orientation[i];
        double len = norm(o);
        if (!(len>0) || !std::isfinite(len)) {
            throw zero_orientation(orientation.size()==1? 0: i);
        }
        unit.push_back((1/len)*o);
    }
    return unit;
}

point_list effective_source_positions(const point_list& sources, const geometry_parameters& geom) {
    if (!geom.source_coords_are_somata) return sources;

    auto orient = source_orientations(geom.orientation, sources.size());
    point_list centres;
    centres.reserve(sources.size());
    for (std::size_t i = 0; i<sources.size(); ++i) {
        centres.push_back(sources[i] + geom.soma_offset*orient[i]);
    }
    return centres;
}

amplitude_matrix compute_amplitude_matrix(const point_list& sources,
                                          const point_list& electrodes,
                                          const amplitude_profile& profile,
                                          const geometry_parameters& geom)
{
    if (sources.empty()) throw empty_coordinates("source coordinates");
    if (electrodes.empty()) throw empty_coordinates("electrode coordinates");

    const size_type n_src = sources.size();
    const size_type n_elec = electrodes.size();

    auto orient = source_orientations(geom.orientation, n_src);
    auto centres = effective_source_positions(sources, geom);

    // Distances and angle cosines over the whole (source × electrode) grid.
    std::vector<double> dist(std::size_t(n_src)*n_elec);
    std::vector<double> cosine(dist.size());
    const bool need_distance = divides_by_distance(profile);

    for (index_type i = 0; i<n_src; ++i) {
        for (index_type j = 0; j<n_elec; ++j) {
            point disp = electrodes[j] - centres[i];
            double d = norm(disp);
            auto k = std::size_t(i)*n_elec + j;
            if (d==0 && need_distance) {
                throw zero_source_distance(i, j);
            }
            dist[k] = d;
            // Angle is undefined at the dipole centre: treat as orthogonal.
            cosine[k] = d>0? dot(disp, orient[i])/d: 0.;
        }
    }

    return amplitude_matrix(n_src, n_elec, evaluate(profile, dist, cosine));
}

} // namespace wslfp
