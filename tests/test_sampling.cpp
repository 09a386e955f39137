#include <gtest/gtest.h>
#include <curve/sampling.hpp>
#include <common/errors.hpp>

using namespace ostiamesh;

TEST(SamplingTest, PointAtArcDistanceOnLine) {
    std::vector<Vec3> nx{Vec3(0, 0, 0), Vec3(2, 0, 0), Vec3(2, 3, 0)};
    std::vector<Vec3> nd{Vec3(2, 0, 0), Vec3(2, 0, 0), Vec3(0, 3, 0)};
    CurvePoint start = cubic_hermite_curves_point_at_arc_distance(nx, nd, -1.0);
    EXPECT_EQ(start.element, 0u);
    EXPECT_DOUBLE_EQ(start.xi, 0.0);

    CurvePoint mid = cubic_hermite_curves_point_at_arc_distance(nx, nd, 1.0);
    EXPECT_EQ(mid.element, 0u);
    EXPECT_NEAR(mid.position.x, 1.0, 1e-6);
    EXPECT_NEAR(mid.xi, 0.5, 1e-6);

    CurvePoint past = cubic_hermite_curves_point_at_arc_distance(nx, nd, 100.0);
    EXPECT_EQ(past.element, 1u);
    EXPECT_DOUBLE_EQ(past.xi, 1.0);
    EXPECT_EQ(past.position, nx.back());
}

TEST(SamplingTest, EvenSamplesOnLine) {
    std::vector<Vec3> nx{Vec3(0, 0, 0), Vec3(10, 0, 0)};
    std::vector<Vec3> nd{Vec3(10, 0, 0), Vec3(10, 0, 0)};
    CurveSamples samples = sample_cubic_hermite_curves_smooth(nx, nd, 5);
    ASSERT_EQ(samples.size(), 6u);
    for (std::size_t n = 0; n < samples.size(); ++n) {
        EXPECT_NEAR(samples.positions[n].x, 2.0 * n, 1e-6);
        EXPECT_NEAR(samples.derivatives[n].length(), 2.0, 1e-6);
        EXPECT_NEAR(samples.scale_factors[n], 0.2, 1e-6);
    }
}

TEST(SamplingTest, GradedSamplesFollowEndMagnitudes) {
    std::vector<Vec3> nx{Vec3(0, 0, 0), Vec3(10, 0, 0)};
    std::vector<Vec3> nd{Vec3(10, 0, 0), Vec3(10, 0, 0)};
    CurveSamples samples = sample_cubic_hermite_curves_smooth(nx, nd, 5, 1.0, 3.0);
    ASSERT_EQ(samples.size(), 6u);
    EXPECT_NEAR(samples.positions[0].x, 0.0, 1e-9);
    EXPECT_NEAR(samples.positions[1].x, 1.2, 1e-6);
    EXPECT_NEAR(samples.positions[5].x, 10.0, 1e-6);
    EXPECT_NEAR(samples.derivatives.front().length(), 1.0, 1e-6);
    EXPECT_NEAR(samples.derivatives.back().length(), 3.0, 1e-6);
    for (std::size_t n = 1; n + 1 < samples.size(); ++n) {
        double before = samples.positions[n].x - samples.positions[n - 1].x;
        double after = samples.positions[n + 1].x - samples.positions[n].x;
        EXPECT_LT(before, after);
    }
}

TEST(SamplingTest, OneEndMagnitudeInfersTheOther) {
    std::vector<Vec3> nx{Vec3(0, 0, 0), Vec3(10, 0, 0)};
    std::vector<Vec3> nd{Vec3(10, 0, 0), Vec3(10, 0, 0)};
    CurveSamples samples = sample_cubic_hermite_curves_smooth(nx, nd, 4, 2.0);
    EXPECT_NEAR(samples.derivatives.back().length(), 3.0, 1e-6);
    EXPECT_NEAR(samples.positions.back().x, 10.0, 1e-6);
}

TEST(SamplingTest, SamplesAcrossElements) {
    std::vector<Vec3> nx{Vec3(0, 0, 0), Vec3(1, 0, 0), Vec3(4, 0, 0)};
    std::vector<Vec3> nd{Vec3(1, 0, 0), Vec3(2, 0, 0), Vec3(3, 0, 0)};
    CurveSamples samples = sample_cubic_hermite_curves_smooth(nx, nd, 4);
    ASSERT_EQ(samples.size(), 5u);
    EXPECT_EQ(samples.elements.front(), 0u);
    EXPECT_EQ(samples.elements.back(), 1u);
    EXPECT_NEAR(samples.positions[2].x, 2.0, 1e-5);
}

TEST(SamplingTest, InterpolateSampleLinear) {
    std::vector<Vec3> nx{Vec3(0, 0, 0), Vec3(10, 0, 0)};
    std::vector<Vec3> nd{Vec3(10, 0, 0), Vec3(10, 0, 0)};
    CurveSamples samples = sample_cubic_hermite_curves_smooth(nx, nd, 4);
    std::vector<double> values = interpolate_sample_linear(std::vector<double>{1.0, 3.0}, samples);
    ASSERT_EQ(values.size(), 5u);
    EXPECT_NEAR(values[0], 1.0, 1e-9);
    EXPECT_NEAR(values[2], 2.0, 1e-6);
    EXPECT_NEAR(values[4], 3.0, 1e-9);

    EXPECT_THROW(interpolate_sample_linear(std::vector<double>{1.0}, samples), PreconditionViolation);
}

TEST(SamplingTest, RejectsBadInput) {
    std::vector<Vec3> one{Vec3()};
    EXPECT_THROW(sample_cubic_hermite_curves_smooth(one, one, 2), PreconditionViolation);
    std::vector<Vec3> nx{Vec3(0, 0, 0), Vec3(1, 0, 0)};
    std::vector<Vec3> nd{Vec3(1, 0, 0), Vec3(1, 0, 0)};
    EXPECT_THROW(sample_cubic_hermite_curves_smooth(nx, nd, 0), PreconditionViolation);
    EXPECT_THROW(sample_cubic_hermite_curves_smooth(nx, one, 2), PreconditionViolation);
}
