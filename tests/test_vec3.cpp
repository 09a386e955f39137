#include <gtest/gtest.h>
#include <math/vec3.hpp>

using namespace ostiamesh;

TEST(Vec3Test, DefaultConstruction) {
    Vec3 v;
    EXPECT_DOUBLE_EQ(v.x, 0.0);
    EXPECT_DOUBLE_EQ(v.y, 0.0);
    EXPECT_DOUBLE_EQ(v.z, 0.0);
    EXPECT_TRUE(v.is_zero());
}

TEST(Vec3Test, Arithmetic) {
    Vec3 a(1.0, 2.0, 3.0);
    Vec3 b(4.0, 5.0, 6.0);
    Vec3 c = a + b * 2.0 - Vec3(1.0, 1.0, 1.0);
    EXPECT_DOUBLE_EQ(c.x, 8.0);
    EXPECT_DOUBLE_EQ(c.y, 11.0);
    EXPECT_DOUBLE_EQ(c.z, 14.0);
}

TEST(Vec3Test, DotAndCross) {
    Vec3 x(1.0, 0.0, 0.0);
    Vec3 y(0.0, 1.0, 0.0);
    EXPECT_DOUBLE_EQ(x.dot(y), 0.0);
    EXPECT_EQ(x.cross(y), vec3::unit_z());
    EXPECT_DOUBLE_EQ(Vec3(1.0, 2.0, 3.0).dot(Vec3(4.0, 5.0, 6.0)), 32.0);
}

TEST(Vec3Test, NormalizedZeroStaysZero) {
    Vec3 n = Vec3(3.0, 4.0, 0.0).normalized();
    EXPECT_DOUBLE_EQ(n.length(), 1.0);
    EXPECT_DOUBLE_EQ(n.x, 0.6);
    EXPECT_TRUE(Vec3().normalized().is_zero());
}

TEST(Vec3Test, WithLength) {
    Vec3 v = Vec3(0.0, 3.0, 4.0).with_length(10.0);
    EXPECT_DOUBLE_EQ(v.y, 6.0);
    EXPECT_DOUBLE_EQ(v.z, 8.0);
    EXPECT_TRUE(Vec3().with_length(2.0).is_zero());
}
