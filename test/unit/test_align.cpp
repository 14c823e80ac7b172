#include <cmath>
#include <vector>

#include "../gtest.h"

#include <wslfp/align.hpp>
#include <wslfp/wslfpexcept.hpp>

using namespace wslfp;

namespace {

// Two sources sampled at 0, 50, 100 ms: a ramp and a constant.
current_trace ramp_trace() {
    current_trace tr;
    tr.times = {0, 50, 100};
    tr.values = sample_matrix(3, 2, std::vector<double>{0, 1, 5, 1, 10, 1});
    return tr;
}

} // anonymous namespace

TEST(align, interpolation) {
    auto tr = ramp_trace();
    std::vector<time_type> t = {0, 25, 50, 60, 100};

    auto r = align(t, tr, "ampa");
    EXPECT_TRUE(r.diagnostics.empty());
    ASSERT_EQ(t.size(), r.values.rows());
    ASSERT_EQ(2u, r.values.cols());

    EXPECT_EQ(0., r.values(0, 0));
    EXPECT_DOUBLE_EQ(2.5, r.values(1, 0));
    EXPECT_EQ(5., r.values(2, 0));
    EXPECT_DOUBLE_EQ(6., r.values(3, 0));
    EXPECT_EQ(10., r.values(4, 0));

    for (std::size_t k = 0; k<t.size(); ++k) {
        EXPECT_DOUBLE_EQ(1., r.values(k, 1));
    }
}

TEST(align, out_of_range_zero_fill) {
    auto tr = ramp_trace();
    std::vector<time_type> t = {-10, 50, 120};

    aligned_currents r;
    ASSERT_NO_THROW(r = align(t, tr, "gaba"));

    EXPECT_EQ(0., r.values(0, 0));
    EXPECT_EQ(0., r.values(0, 1));
    EXPECT_EQ(5., r.values(1, 0));
    EXPECT_EQ(0., r.values(2, 0));
    EXPECT_EQ(0., r.values(2, 1));

    ASSERT_EQ(1u, r.diagnostics.size());
    const auto& d = r.diagnostics.front();
    EXPECT_EQ(diagnostic_kind::out_of_range, d.kind);
    EXPECT_EQ("gaba", d.trace);
    EXPECT_EQ(2u, d.count);
    EXPECT_EQ(-10., d.requested_min);
    EXPECT_EQ(120., d.requested_max);
    EXPECT_EQ(0., d.available_min);
    EXPECT_EQ(100., d.available_max);
    EXPECT_NE(std::string::npos, d.message.find("gaba"));
}

TEST(align, single_point_before_range) {
    auto tr = ramp_trace();
    std::vector<time_type> t = {-10};

    auto r = align(t, tr);
    EXPECT_EQ(0., r.values(0, 0));
    EXPECT_EQ(0., r.values(0, 1));
    EXPECT_EQ(1u, r.diagnostics.size());
}

TEST(align, strict) {
    auto tr = ramp_trace();
    std::vector<time_type> inside = {0, 100};
    std::vector<time_type> outside = {-10, 50};

    EXPECT_NO_THROW(align(inside, tr, "ampa", boundary_policy::strict));

    try {
        align(outside, tr, "ampa", boundary_policy::strict);
        FAIL() << "expected out_of_range_times";
    }
    catch (out_of_range_times& e) {
        EXPECT_EQ("ampa", e.trace);
        EXPECT_EQ(-10., e.requested_min);
        EXPECT_EQ(100., e.available_max);
    }
}

TEST(align, empty_eval_times) {
    auto tr = ramp_trace();
    std::vector<time_type> t;

    auto r = align(t, tr);
    EXPECT_EQ(0u, r.values.rows());
    EXPECT_TRUE(r.diagnostics.empty());
}

TEST(align, single_sample_trace) {
    current_trace tr;
    tr.times = {5};
    tr.values = sample_matrix(1, 1, 3.);

    std::vector<time_type> t = {5, 6};
    auto r = align(t, tr);
    EXPECT_EQ(3., r.values(0, 0));
    EXPECT_EQ(0., r.values(1, 0));
    EXPECT_EQ(1u, r.diagnostics.size());
}

TEST(align, invalid_trace) {
    std::vector<time_type> t = {0};

    current_trace empty;
    EXPECT_THROW(align(t, empty), bad_time_axis);

    current_trace unsorted = ramp_trace();
    unsorted.times = {0, 100, 50};
    EXPECT_THROW(align(t, unsorted), bad_time_axis);

    current_trace repeated = ramp_trace();
    repeated.times = {0, 50, 50};
    EXPECT_THROW(align(t, repeated), bad_time_axis);

    current_trace nonfinite = ramp_trace();
    nonfinite.times = {0, NAN, 100};
    EXPECT_THROW(align(t, nonfinite), bad_time_axis);

    current_trace short_values = ramp_trace();
    short_values.values = sample_matrix(2, 2, 0.);
    EXPECT_THROW(align(t, short_values), bad_current_shape);
}

TEST(align, non_finite_eval_times) {
    auto tr = ramp_trace();

    std::vector<time_type> nan_time = {10, NAN, 20};
    EXPECT_THROW(align(nan_time, tr), domain_error);

    std::vector<time_type> inf_time = {INFINITY};
    EXPECT_THROW(align(inf_time, tr, "gaba", boundary_policy::strict), domain_error);
}

TEST(validate_trace, columns) {
    auto tr = ramp_trace();
    EXPECT_NO_THROW(validate_trace("ampa", tr, 2));
    EXPECT_NO_THROW(validate_trace("ampa", tr));

    try {
        validate_trace("ampa", tr, 3);
        FAIL() << "expected bad_current_shape";
    }
    catch (bad_current_shape& e) {
        EXPECT_EQ(2u, e.cols);
        EXPECT_EQ(3u, e.expected_cols);
    }
}
