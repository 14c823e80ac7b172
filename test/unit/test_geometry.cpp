#include <cmath>
#include <vector>

#include "../gtest.h"

#include <wslfp/geometry.hpp>
#include <wslfp/math.hpp>
#include <wslfp/profile.hpp>
#include <wslfp/wslfpexcept.hpp>

using namespace wslfp;

namespace {

geometry_parameters centred() {
    geometry_parameters g;
    g.source_coords_are_somata = false;
    return g;
}

} // anonymous namespace

TEST(geometry, to_points) {
    auto pts = to_points({{1, 2, 3}, {4, 5, 6}});
    ASSERT_EQ(2u, pts.size());
    EXPECT_EQ((point{4, 5, 6}), pts[1]);

    EXPECT_THROW(to_points({{1, 2, 3}, {4, 5}}), bad_coordinate_shape);
    EXPECT_THROW(to_points({{1, 2, 3, 4}}), bad_coordinate_shape);

    try {
        to_points({{1, 2, 3}, {1, 2, 3}, {0, 0}}, "electrodes");
        FAIL() << "expected bad_coordinate_shape";
    }
    catch (bad_coordinate_shape& e) {
        EXPECT_EQ(2u, e.row);
        EXPECT_EQ(2u, e.width);
        EXPECT_EQ("electrodes", e.coordinates);
    }
}

TEST(geometry, orientations) {
    // broadcast a single orientation, normalising length
    auto o = source_orientations({{0, 0, 5}}, 3);
    ASSERT_EQ(3u, o.size());
    for (auto& p: o) EXPECT_EQ((point{0, 0, 1}), p);

    auto per = source_orientations({{1, 0, 0}, {0, 2, 0}}, 2);
    EXPECT_EQ((point{0, 1, 0}), per[1]);

    EXPECT_THROW(source_orientations({{0, 0, 1}, {0, 0, 1}}, 3), bad_orientation_count);
    EXPECT_THROW(source_orientations({}, 3), bad_orientation_count);
    EXPECT_THROW(source_orientations({{0, 0, 1}, {0, 0, 0}}, 2), zero_orientation);
}

TEST(geometry, dipole_centres) {
    point_list somata = {{0, 0, 0}, {10, 0, 0}};
    geometry_parameters g;
    g.orientation = {{0, 0, 1}, {1, 0, 0}};
    g.soma_offset = 100;

    auto c = effective_source_positions(somata, g);
    EXPECT_EQ((point{0, 0, 100}), c[0]);
    EXPECT_EQ((point{110, 0, 0}), c[1]);

    g.source_coords_are_somata = false;
    EXPECT_EQ(somata, effective_source_positions(somata, g));
}

TEST(geometry, shape) {
    point_list sources = {{0, 0, 0}, {50, 0, 0}, {0, 50, 0}};
    point_list electrodes = {{0, 0, 100}, {0, 0, 200}, {0, 0, -100}, {30, 30, 30}, {0, 0, 400}};

    auto table = std::make_shared<const calibration_table>(
        std::vector<double>{0, 1000}, std::vector<double>{-1000, 1000}, std::vector<double>{1, 1, 1, 1});
    profile_parameters params;
    params.population_table = table;
    params.neuron_table = table;

    for (auto name: {"aussel", "mazzoni_pop", "mazzoni_nrn"}) {
        auto A = compute_amplitude_matrix(sources, electrodes, make_profile(name, params));
        EXPECT_EQ(sources.size(), A.rows());
        EXPECT_EQ(electrodes.size(), A.cols());
    }
}

TEST(geometry, aussel_on_axis) {
    aussel_profile a(250, 0.3);
    auto A = compute_amplitude_matrix({{0, 0, 0}}, {{0, 0, 100}}, a, centred());

    ASSERT_EQ(1u, A.rows());
    ASSERT_EQ(1u, A.cols());
    EXPECT_DOUBLE_EQ(250/(4*math::pi<double>*0.3*100*100), A(0, 0));
}

TEST(geometry, aussel_angles) {
    aussel_profile a;
    point_list electrodes = {{0, 0, 100}, {100, 0, 0}, {0, 0, -100}, {0, 60, 80}};
    auto A = compute_amplitude_matrix({{0, 0, 0}}, electrodes, a, centred());

    // above, beside and below the source
    EXPECT_GT(A(0, 0), 0);
    EXPECT_EQ(0., A(0, 1));
    EXPECT_DOUBLE_EQ(-A(0, 0), A(0, 2));
    // cos θ = 0.8 at the same distance
    EXPECT_DOUBLE_EQ(0.8*A(0, 0), A(0, 3));
}

TEST(geometry, orientation_direction) {
    aussel_profile a;
    point_list electrodes = {{0, 0, 100}};

    geometry_parameters down = centred();
    down.orientation = {{0, 0, -3}};

    auto up = compute_amplitude_matrix({{0, 0, 0}}, electrodes, a, centred());
    auto dn = compute_amplitude_matrix({{0, 0, 0}}, electrodes, a, down);
    EXPECT_DOUBLE_EQ(-up(0, 0), dn(0, 0));
}

TEST(geometry, somata_shift) {
    aussel_profile a;
    geometry_parameters g;
    g.soma_offset = 50;

    // soma at origin: dipole centre at z=50, so electrode at z=100 is 50 µm above it
    auto A = compute_amplitude_matrix({{0, 0, 0}}, {{0, 0, 100}}, a, g);
    EXPECT_DOUBLE_EQ(a.evaluate(50, 1), A(0, 0));
}

TEST(geometry, soma_offset_independent_of_dipole_length) {
    // A longer dipole scales the amplitude but does not move the dipole centre.
    aussel_profile longer(400, 0.3);
    geometry_parameters g;

    auto A = compute_amplitude_matrix({{0, 0, 0}}, {{0, 0, 300}}, longer, g);
    EXPECT_DOUBLE_EQ(longer.evaluate(300-g.soma_offset, 1), A(0, 0));
    EXPECT_EQ(125., g.soma_offset);
}

TEST(geometry, zero_distance) {
    aussel_profile a;
    point_list sources = {{0, 0, 0}, {0, 0, 10}};
    point_list electrodes = {{5, 5, 5}, {0, 0, 10}};

    try {
        compute_amplitude_matrix(sources, electrodes, a, centred());
        FAIL() << "expected zero_source_distance";
    }
    catch (zero_source_distance& e) {
        EXPECT_EQ(1u, e.source);
        EXPECT_EQ(1u, e.electrode);
    }

    // table profiles are defined at the source
    mazzoni_profile m(mazzoni_variant::population, std::make_shared<const calibration_table>(
        std::vector<double>{0, 100}, std::vector<double>{-100, 100}, std::vector<double>{4, 4, 0, 0}));
    auto A = compute_amplitude_matrix(sources, electrodes, m, centred());
    EXPECT_DOUBLE_EQ(4., A(1, 1));
}

TEST(geometry, empty) {
    aussel_profile a;
    EXPECT_THROW(compute_amplitude_matrix({}, {{0, 0, 1}}, a), empty_coordinates);
    EXPECT_THROW(compute_amplitude_matrix({{0, 0, 1}}, {}, a), empty_coordinates);
}

TEST(geometry, deterministic) {
    aussel_profile a;
    point_list sources = {{1, 2, 3}, {-4, 5, 60}, {7, -80, 9}};
    point_list electrodes = {{0, 0, 100}, {10, 20, -30}};
    geometry_parameters g;
    g.orientation = {{0.1, 0.2, 1}};

    EXPECT_EQ(compute_amplitude_matrix(sources, electrodes, a, g),
              compute_amplitude_matrix(sources, electrodes, a, g));
}
