#include <gtest/gtest.h>
#include <units/bike_scale.hpp>
#include "test_helpers.hpp"

using namespace rearlink;
using namespace rearlink::test;

class BikeScaleTest : public ::testing::Test {
protected:
    std::vector<LinkagePoint> points;

    void SetUp() override {
        points = {
            point("bb", PointType::BottomBracket, 100.0, 200.0),
            point("axle", PointType::RearAxle, 400.0, 600.0),  // 500 px from bb
            point("pivot", PointType::Fixed, 150.0, 180.0),
        };
    }
};

TEST_F(BikeScaleTest, ExplicitScaleWins) {
    BikeGeometry geometry;
    geometry.scale_mm_per_px = 0.8;
    geometry.rear_center_mm = 435.0;

    auto scale = resolve_scale(geometry, points);
    ASSERT_TRUE(scale.has_value());
    EXPECT_DOUBLE_EQ(*scale, 0.8);
}

TEST_F(BikeScaleTest, DerivesScaleFromRearCenter) {
    BikeGeometry geometry;
    geometry.rear_center_mm = 435.0;

    auto scale = resolve_scale(geometry, points);
    ASSERT_TRUE(scale.has_value());
    EXPECT_DOUBLE_EQ(*scale, 435.0 / 500.0);
}

TEST_F(BikeScaleTest, NoScaleWithoutGeometry) {
    EXPECT_FALSE(resolve_scale(BikeGeometry{}, points).has_value());
}

TEST_F(BikeScaleTest, NoScaleWithoutRearAxle) {
    points[1].type = PointType::Free;
    BikeGeometry geometry;
    geometry.rear_center_mm = 435.0;

    EXPECT_FALSE(resolve_scale(geometry, points).has_value());
}

TEST_F(BikeScaleTest, RejectsNonPositiveValues) {
    BikeGeometry geometry;
    geometry.scale_mm_per_px = 0.0;
    EXPECT_THROW(resolve_scale(geometry, points), UnitsError);

    geometry.scale_mm_per_px.reset();
    geometry.rear_center_mm = -10.0;
    EXPECT_THROW(resolve_scale(geometry, points), UnitsError);
}

TEST_F(BikeScaleTest, RejectsCoincidentBottomBracketAndAxle) {
    points[1].position = points[0].position;
    BikeGeometry geometry;
    geometry.rear_center_mm = 435.0;

    EXPECT_THROW(resolve_scale(geometry, points), UnitsError);
}

TEST_F(BikeScaleTest, ConvertsOnlyTheShockToPixels) {
    std::vector<RigidBody> bodies = {
        body("stay", BodyType::Bar, {"pivot", "axle"}),
        body("shock", BodyType::Shock, {"bb", "pivot"}, 50.0),
    };
    bodies[0].length0 = 120.0;
    bodies[1].length0 = 210.0;

    auto converted = shock_to_pixels(bodies, 0.5);

    EXPECT_DOUBLE_EQ(converted[1].stroke.value(), 100.0);
    EXPECT_DOUBLE_EQ(converted[1].length0.value(), 420.0);
    EXPECT_DOUBLE_EQ(converted[0].length0.value(), 120.0);

    // Input untouched
    EXPECT_DOUBLE_EQ(bodies[1].stroke.value(), 50.0);
}

TEST_F(BikeScaleTest, ConvertsScalarOutputsToMillimeters) {
    SolverResult result;
    SolverStep step;
    step.shock_stroke = 10.0;
    step.shock_length = 200.0;
    step.rear_travel = 30.0;
    step.leverage_ratio = 3.0;
    step.points.emplace_back("axle", Vec2(400.0, 570.0));
    result.steps.push_back(step);

    result_to_millimeters(result, 0.5);

    const auto& converted = result.steps[0];
    EXPECT_DOUBLE_EQ(converted.shock_stroke, 5.0);
    EXPECT_DOUBLE_EQ(converted.shock_length, 100.0);
    EXPECT_DOUBLE_EQ(converted.rear_travel.value(), 15.0);
    EXPECT_DOUBLE_EQ(converted.leverage_ratio.value(), 3.0);
    EXPECT_EQ(converted.point("axle"), Vec2(400.0, 570.0));
}

TEST_F(BikeScaleTest, ParsesShockUnits) {
    EXPECT_EQ(parse_shock_units("px"), ShockUnits::Pixels);
    EXPECT_EQ(parse_shock_units("mm"), ShockUnits::Millimeters);
    EXPECT_STREQ(shock_units_name(ShockUnits::Millimeters), "mm");
    EXPECT_THROW(parse_shock_units("inch"), UnitsError);
}
