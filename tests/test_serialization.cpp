#include <gtest/gtest.h>
#include <serialization/linkage_json.hpp>
#include <serialization/result_json.hpp>
#include <serialization/config_json.hpp>
#include <serialization/output_json.hpp>
#include <linkage/linkage_error.hpp>
#include "test_helpers.hpp"
#include <filesystem>
#include <fstream>

using namespace rearlink;
using namespace rearlink::test;

namespace {

const char* kBikeJson = R"({
  "points": [
    {"id": "bb", "type": "bb", "x": 100.0, "y": 200.0, "name": "Bottom bracket"},
    {"id": "main", "type": "fixed", "x": 120.0, "y": 150.0},
    {"id": "axle", "type": "rear_axle", "x": 500.0, "y": 210.0},
    {"id": "rocker", "type": "free", "x": 200.0, "y": 100.0}
  ],
  "bodies": [
    {"id": "swingarm", "point_ids": ["main", "axle", "rocker"], "type": "bar", "closed": true},
    {"id": "shock", "point_ids": ["bb", "rocker"], "type": "shock", "stroke": 60.0, "length0": 210.0},
    {"id": "note", "point_ids": ["axle"]}
  ],
  "geometry": {"rear_center_mm": 435.0, "scale_mm_per_px": null},
  "shock_units": "mm"
})";

}  // namespace

TEST(SerializationTest, ParsesBikeDocument) {
    BikeDocument bike = nlohmann::json::parse(kBikeJson).get<BikeDocument>();

    ASSERT_EQ(bike.points.size(), 4u);
    EXPECT_EQ(bike.points[0].type, PointType::BottomBracket);
    EXPECT_EQ(bike.points[0].name.value_or(""), "Bottom bracket");
    EXPECT_FALSE(bike.points[1].name.has_value());
    EXPECT_EQ(bike.points[2].type, PointType::RearAxle);
    EXPECT_DOUBLE_EQ(bike.points[2].position.x, 500.0);

    ASSERT_EQ(bike.bodies.size(), 3u);
    EXPECT_TRUE(bike.bodies[0].closed);
    EXPECT_EQ(bike.bodies[1].type, BodyType::Shock);
    EXPECT_DOUBLE_EQ(bike.bodies[1].stroke.value(), 60.0);
    EXPECT_DOUBLE_EQ(bike.bodies[1].length0.value(), 210.0);
    EXPECT_FALSE(bike.bodies[0].stroke.has_value());

    // Untyped body defaults to a bar
    EXPECT_EQ(bike.bodies[2].type, BodyType::Bar);
    EXPECT_FALSE(bike.bodies[2].closed);

    EXPECT_DOUBLE_EQ(bike.geometry.rear_center_mm.value(), 435.0);
    EXPECT_FALSE(bike.geometry.scale_mm_per_px.has_value());
    EXPECT_EQ(bike.shock_units, ShockUnits::Millimeters);
}

TEST(SerializationTest, ShockUnitsDefaultToPixels) {
    auto j = nlohmann::json::parse(kBikeJson);
    j.erase("shock_units");
    j.erase("geometry");

    BikeDocument bike = j.get<BikeDocument>();

    EXPECT_EQ(bike.shock_units, ShockUnits::Pixels);
    EXPECT_FALSE(bike.geometry.rear_center_mm.has_value());
}

TEST(SerializationTest, RejectsUnknownPointType) {
    auto j = nlohmann::json::parse(kBikeJson);
    j["points"][3]["type"] = "pivot";

    try {
        j.get<BikeDocument>();
        FAIL() << "expected UnknownTypeError";
    } catch (const UnknownTypeError& e) {
        EXPECT_EQ(e.value(), "pivot");
    }
}

TEST(SerializationTest, RejectsUnknownBodyType) {
    auto j = nlohmann::json::parse(kBikeJson);
    j["bodies"][0]["type"] = "spring";

    EXPECT_THROW(j.get<BikeDocument>(), UnknownTypeError);
}

TEST(SerializationTest, DocumentSurvivesRoundTrip) {
    BikeDocument original = nlohmann::json::parse(kBikeJson).get<BikeDocument>();

    nlohmann::json j = original;
    BikeDocument restored = j.get<BikeDocument>();

    ASSERT_EQ(restored.points.size(), original.points.size());
    EXPECT_EQ(restored.points[2].position, original.points[2].position);
    EXPECT_EQ(restored.bodies[0].point_ids, original.bodies[0].point_ids);
    EXPECT_EQ(restored.bodies[1].stroke, original.bodies[1].stroke);
    EXPECT_EQ(restored.shock_units, original.shock_units);
}

TEST(SerializationTest, ParsedDocumentSolves) {
    BikeDocument bike = nlohmann::json::parse(kBikeJson).get<BikeDocument>();

    SolveConfig config;
    config.n_steps = 8;
    BikeSolution solution = solve_bike(bike, config);

    EXPECT_EQ(solution.result.steps.size(), 9u);
    EXPECT_EQ(solution.result.rear_axle_point_id.value_or(""), "axle");
    EXPECT_NEAR(solution.result.steps.back().shock_stroke, 60.0, 1e-9);
}

TEST(SerializationTest, StepWritesNullForUndefinedValues) {
    SolverStep step;
    step.step_index = 0;
    step.shock_stroke = 0.0;
    step.shock_length = 210.0;
    step.rear_travel = 0.0;
    step.points.emplace_back("axle", Vec2(500.0, 210.0));
    step.points.emplace_back("bb", Vec2(100.0, 200.0));

    nlohmann::json j = step;

    EXPECT_TRUE(j["leverage_ratio"].is_null());
    EXPECT_DOUBLE_EQ(j["rear_travel"].get<double>(), 0.0);
    ASSERT_EQ(j["points"].size(), 2u);
    EXPECT_EQ(j["points"][0]["id"].get<std::string>(), "axle");
    EXPECT_DOUBLE_EQ(j["points"][0]["x"].get<double>(), 500.0);
    EXPECT_DOUBLE_EQ(j["points"][0]["y"].get<double>(), 210.0);
    EXPECT_EQ(j["points"][1]["id"].get<std::string>(), "bb");
}

TEST(SerializationTest, ResultReadsBack) {
    BikeDocument bike = rocker();
    SolveConfig config;
    config.n_steps = 4;
    SolverResult result = solve_linkage(bike.points, bike.bodies, config);

    nlohmann::json j = result;
    SolverResult restored = j.get<SolverResult>();

    ASSERT_EQ(restored.steps.size(), 5u);
    EXPECT_EQ(restored.rear_axle_point_id, result.rear_axle_point_id);
    EXPECT_FALSE(restored.steps[0].leverage_ratio.has_value());
    EXPECT_DOUBLE_EQ(restored.steps[4].leverage_ratio.value(),
                     result.steps[4].leverage_ratio.value());
    EXPECT_EQ(restored.steps[2].points, result.steps[2].points);
    EXPECT_EQ(restored.steps[2].points.front().first, "pivot");
}

TEST(SerializationTest, SolveConfigDefaults) {
    SolveConfig config = nlohmann::json::object().get<SolveConfig>();
    EXPECT_EQ(config.n_steps, 80);
    EXPECT_EQ(config.iterations, 100);

    config = nlohmann::json{{"iterations", 250}}.get<SolveConfig>();
    EXPECT_EQ(config.n_steps, 80);
    EXPECT_EQ(config.iterations, 250);
}

TEST(SerializationTest, SolutionCarriesUnits) {
    BikeDocument bike = rocker();
    bike.geometry.scale_mm_per_px = 0.5;
    SolveConfig config;
    config.n_steps = 2;

    nlohmann::json j = solution_to_json(solve_bike(bike, config));

    EXPECT_EQ(j["units"].get<std::string>(), "mm");
    EXPECT_DOUBLE_EQ(j["scale_mm_per_px"].get<double>(), 0.5);
    EXPECT_EQ(j["steps"].size(), 3u);
    EXPECT_EQ(j["rear_axle_point_id"].get<std::string>(), "axle");
}

TEST(SerializationTest, BatchKeepsGoodBikesWhenOneFailsToParse) {
    nlohmann::json bad = nlohmann::json::parse(kBikeJson);
    bad["points"][1]["type"] = "fixd";
    nlohmann::json input = {
        {"bikes", {
            {"good", nlohmann::json::parse(kBikeJson)},
            {"typo", bad}
        }}
    };

    BikeBatch batch = read_bike_batch(input);

    ASSERT_EQ(batch.bikes.size(), 1u);
    EXPECT_EQ(batch.bikes[0].first, "good");
    ASSERT_EQ(batch.rejected.size(), 1u);
    EXPECT_EQ(batch.rejected[0].name, "typo");
    EXPECT_FALSE(batch.rejected[0].solution.has_value());
    EXPECT_NE(batch.rejected[0].error.value_or("").find("fixd"), std::string::npos);

    SolveConfig config;
    config.n_steps = 4;
    auto entries = solve_batch(batch.bikes, config);
    entries.insert(entries.end(), batch.rejected.begin(), batch.rejected.end());

    nlohmann::json j = batch_document("bikes.json", entries, config, BatchConfig{});
    EXPECT_EQ(j["kind"].get<std::string>(), "linkage_batch");
    EXPECT_EQ(j["stats"]["bike_count"].get<size_t>(), 2u);
    EXPECT_EQ(j["stats"]["failed_count"].get<size_t>(), 1u);
    EXPECT_TRUE(j["data"]["results"].contains("good"));
    EXPECT_EQ(j["data"]["results"]["good"]["steps"].size(), 5u);
    EXPECT_TRUE(j["data"]["errors"].contains("typo"));
    EXPECT_FALSE(j["data"]["errors"].contains("good"));
}

TEST(SerializationTest, BatchNeedsBikesObject) {
    EXPECT_THROW(read_bike_batch(nlohmann::json::object()), nlohmann::json::out_of_range);
    nlohmann::json listed;
    listed["bikes"] = nlohmann::json::array();
    EXPECT_THROW(read_bike_batch(listed), std::runtime_error);
}

TEST(SerializationTest, SolutionDocumentCarriesSettings) {
    BikeDocument bike = nlohmann::json::parse(kBikeJson).get<BikeDocument>();
    SolveConfig config;
    config.n_steps = 6;
    config.iterations = 40;

    nlohmann::json j = solution_document("bike.json", bike, solve_bike(bike, config), config);

    EXPECT_EQ(j["format"].get<std::string>(), "rearlink");
    EXPECT_EQ(j["kind"].get<std::string>(), "linkage_solution");
    EXPECT_EQ(j["source_file"].get<std::string>(), "bike.json");
    EXPECT_FALSE(j["created_at"].get<std::string>().empty());
    EXPECT_EQ(j["config"]["solve"]["n_steps"].get<int>(), 6);
    EXPECT_EQ(j["config"]["solve"]["iterations"].get<int>(), 40);
    EXPECT_EQ(j["config"]["shock_units"].get<std::string>(), "mm");
    EXPECT_DOUBLE_EQ(j["config"]["geometry"]["rear_center_mm"].get<double>(), 435.0);
    EXPECT_FALSE(j["config"].contains("batch"));
    EXPECT_EQ(j["stats"]["step_count"].get<size_t>(), 7u);
    EXPECT_EQ(j["data"]["units"].get<std::string>(), "mm");
}

TEST(SerializationTest, InvalidJsonNamesTheFile) {
    auto path = std::filesystem::temp_directory_path() / "rearlink_invalid.json";
    {
        std::ofstream out(path);
        out << "{\"points\": [";
    }

    try {
        json::read_json_file(path.string());
        FAIL() << "expected a parse failure";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find(path.string()), std::string::npos);
    }
    std::filesystem::remove(path);

    EXPECT_THROW(json::read_json_file(path.string()), std::runtime_error);
}
