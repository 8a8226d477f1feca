#include <gtest/gtest.h>
#include <geo/view_orientation.hpp>
#include "test_helpers.hpp"

using namespace atlas::geo;
using test_utils::expect_vec3_near;
using test_utils::expect_same_rotation;

TEST(ViewOrientationTest, TargetVectorUsesNegatedLatitude) {
    expect_vec3_near(view_target_vector(0.0, 0.0), vec3(0.0f, 0.0f, 1.0f));
    expect_vec3_near(view_target_vector(0.0, 90.0), vec3(1.0f, 0.0f, 0.0f));
    expect_vec3_near(view_target_vector(30.0, 0.0), vec3(0.0f, -0.5f, 0.8660254f));
}

TEST(ViewOrientationTest, OriginIsHalfTurnAboutY) {
    expect_same_rotation(solve_orientation(0.0, 0.0), quat(0.0f, 1.0f, 0.0f, 0.0f));
}

TEST(ViewOrientationTest, TargetIsBroughtToViewer) {
    const double coords[][2] = {
        {0.0, 0.0}, {38.0, -97.0}, {-33.9, 151.2}, {51.5, -0.1},
        {-75.0, 10.0}, {10.0, 179.0}, {60.0, 100.0}
    };
    for (const auto& c : coords) {
        quat q = solve_orientation(c[0], c[1]);
        EXPECT_NEAR(q.length(), 1.0f, 1e-5f);
        expect_vec3_near(q.rotate(view_target_vector(c[0], c[1])), VIEW_FORWARD, 1e-4f);
    }
}

TEST(ViewOrientationTest, NorthStaysUp) {
    const double coords[][2] = {
        {0.0, 0.0}, {38.0, -97.0}, {-33.9, 151.2}, {51.5, -0.1}, {-75.0, 10.0}
    };
    for (const auto& c : coords) {
        quat q = solve_orientation(c[0], c[1]);
        vec3 north = q.rotate(NORTH_POLE);
        EXPECT_NEAR(north.x, 0.0f, 1e-4f) << c[0] << ", " << c[1];
        EXPECT_GT(north.y, 0.0f) << c[0] << ", " << c[1];
        EXPECT_NEAR(residual_roll(q), 0.0f, 1e-4f);
    }
}

TEST(ViewOrientationTest, ResidualRollOfIdentityIsZero) {
    EXPECT_FLOAT_EQ(residual_roll(quat{}), 0.0f);
    quat rolled = quat::from_axis_angle(VIEW_FORWARD, 0.3f);
    EXPECT_NEAR(std::fabs(residual_roll(rolled)), 0.3f, 1e-5f);
}
