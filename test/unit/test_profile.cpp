#include <cmath>
#include <memory>
#include <vector>

#include "../gtest.h"

#include <wslfp/math.hpp>
#include <wslfp/profile.hpp>
#include <wslfp/wslfpexcept.hpp>

using namespace wslfp;

namespace {

// Table sampling the linear function 1 + r + 2h, which bilinear
// interpolation reproduces exactly.
std::shared_ptr<const calibration_table> linear_table() {
    std::vector<double> radius = {0, 100, 200};
    std::vector<double> depth = {-200, -100, 0, 100, 200};
    std::vector<double> amp;
    for (double r: radius) {
        for (double h: depth) {
            amp.push_back(1 + r + 2*h);
        }
    }
    return std::make_shared<const calibration_table>(radius, depth, amp);
}

} // anonymous namespace

TEST(calibration_table, interpolation) {
    auto table = linear_table();

    // grid points
    EXPECT_EQ(1., (*table)(0, 0));
    EXPECT_EQ(601., (*table)(200, 200));
    EXPECT_EQ(-399., (*table)(0, -200));

    // interior
    EXPECT_NEAR(1+50+2*(-30), (*table)(50, -30), 1e-9);
    EXPECT_NEAR(1+175+2*150, (*table)(175, 150), 1e-9);

    // on the upper edges
    EXPECT_NEAR(1+200+2*50, (*table)(200, 50), 1e-9);
    EXPECT_NEAR(1+120+2*200, (*table)(120, 200), 1e-9);
}

TEST(calibration_table, outside) {
    auto table = linear_table();

    EXPECT_EQ(0., (*table)(200.5, 0));
    EXPECT_EQ(0., (*table)(10, 201));
    EXPECT_EQ(0., (*table)(10, -201));
    EXPECT_EQ(0., (*table)(-1, 0));
}

TEST(calibration_table, invalid) {
    // radius must start at zero
    EXPECT_THROW(calibration_table({10, 20}, {0, 1}, {1, 2, 3, 4}), bad_calibration_table);
    // strictly increasing axes
    EXPECT_THROW(calibration_table({0, 0}, {0, 1}, {1, 2, 3, 4}), bad_calibration_table);
    EXPECT_THROW(calibration_table({0, 1}, {1, 0}, {1, 2, 3, 4}), bad_calibration_table);
    // grid size
    EXPECT_THROW(calibration_table({0, 1}, {0, 1}, {1, 2, 3}), bad_calibration_table);
    // empty axes
    EXPECT_THROW(calibration_table({}, {0, 1}, {}), bad_calibration_table);
    // non-finite values
    EXPECT_THROW(calibration_table({0, 1}, {0, 1}, {1, 2, 3, NAN}), bad_calibration_table);
}

TEST(calibration_table, single_point) {
    calibration_table t({0}, {0}, {3.5});
    EXPECT_EQ(3.5, t(0, 0));
    EXPECT_EQ(0., t(0, 1));
}

TEST(profile, make_by_name) {
    profile_parameters params;
    params.population_table = linear_table();
    params.neuron_table = linear_table();

    EXPECT_EQ("aussel", profile_name(make_profile("aussel", params)));
    EXPECT_EQ("aussel", profile_name(make_profile("aussel18", params)));
    EXPECT_EQ("mazzoni_pop", profile_name(make_profile("mazzoni_pop", params)));
    EXPECT_EQ("mazzoni_pop", profile_name(make_profile("mazzoni15_pop", params)));
    EXPECT_EQ("mazzoni_nrn", profile_name(make_profile("mazzoni_nrn", params)));
    EXPECT_EQ("mazzoni_nrn", profile_name(make_profile("mazzoni15_nrn", params)));

    EXPECT_TRUE(divides_by_distance(make_profile("aussel", params)));
    EXPECT_FALSE(divides_by_distance(make_profile("mazzoni_pop", params)));
}

TEST(profile, make_errors) {
    EXPECT_THROW(make_profile("mazzoni"), unknown_profile);
    EXPECT_THROW(make_profile(""), unknown_profile);

    // Mazzoni profiles need their calibration data.
    EXPECT_THROW(make_profile("mazzoni_pop"), missing_calibration_table);
    EXPECT_THROW(make_profile("mazzoni_nrn"), missing_calibration_table);

    profile_parameters p;
    p.conductivity = 0;
    EXPECT_THROW(make_profile("aussel", p), bad_profile_parameter);
    p.conductivity = 0.3;
    p.dipole_length = -1;
    EXPECT_THROW(make_profile("aussel", p), bad_profile_parameter);
}

TEST(aussel, closed_form) {
    aussel_profile a(250, 0.3);
    double expected = 250*0.8/(4*math::pi<double>*0.3*100*100);
    EXPECT_DOUBLE_EQ(expected, a.evaluate(100, 0.8));
    EXPECT_DOUBLE_EQ(expected, evaluate(amplitude_profile(a), 100, 0.8));
}

TEST(aussel, inverse_square) {
    aussel_profile a;
    for (double d: {10., 55., 300.}) {
        EXPECT_DOUBLE_EQ(0.25, a.evaluate(2*d, 0.7)/a.evaluate(d, 0.7));
        EXPECT_DOUBLE_EQ(1./9, a.evaluate(3*d, -0.2)/a.evaluate(d, -0.2));
    }
}

TEST(aussel, orthogonal_and_sign) {
    aussel_profile a;
    EXPECT_EQ(0., a.evaluate(120, 0));
    EXPECT_GT(a.evaluate(120, 1e-3), 0);
    EXPECT_LT(a.evaluate(120, -1e-3), 0);
    EXPECT_DOUBLE_EQ(-a.evaluate(80, 0.5), a.evaluate(80, -0.5));
}

TEST(aussel, zero_distance) {
    aussel_profile a;
    EXPECT_THROW(a.evaluate(0, 1), domain_error);
}

TEST(mazzoni, evaluate) {
    mazzoni_profile m(mazzoni_variant::population, linear_table());

    // distance 100, cos 0.6: radial 80, depth 60
    EXPECT_NEAR(1+80+2*60, m.evaluate(100, 0.6), 1e-9);
    // straight below the source
    EXPECT_NEAR(1+0+2*(-150), m.evaluate(150, -1), 1e-9);
    // defined at the source itself
    EXPECT_EQ(1., m.evaluate(0, 0));
    // beyond the table
    EXPECT_EQ(0., m.evaluate(1000, 0.1));
}

TEST(mazzoni, variants_use_own_table) {
    auto shrunk = std::make_shared<const calibration_table>(
        std::vector<double>{0, 50}, std::vector<double>{-50, 50}, std::vector<double>{2, 2, 2, 2});

    profile_parameters params;
    params.population_table = linear_table();
    params.neuron_table = shrunk;

    auto pop = make_profile("mazzoni_pop", params);
    auto nrn = make_profile("mazzoni_nrn", params);

    EXPECT_NEAR(1+30+2*40, evaluate(pop, 50, 0.8), 1e-9);
    EXPECT_DOUBLE_EQ(2., evaluate(nrn, 50, 0.8));
    EXPECT_EQ(0., evaluate(nrn, 100, 0.8));
}

TEST(profile, vectorized) {
    std::vector<amplitude_profile> profiles = {
        aussel_profile(),
        mazzoni_profile(mazzoni_variant::population, linear_table())
    };
    std::vector<double> dist = {10, 50, 100, 150};
    std::vector<double> cosine = {1, -0.5, 0, 0.25};

    for (const auto& p: profiles) {
        auto v = evaluate(p, dist, cosine);
        ASSERT_EQ(dist.size(), v.size());
        for (std::size_t i = 0; i<v.size(); ++i) {
            EXPECT_EQ(evaluate(p, dist[i], cosine[i]), v[i]);
        }
        std::vector<double> short_cos = {1};
        EXPECT_THROW(evaluate(p, dist, short_cos), domain_error);
    }
}
