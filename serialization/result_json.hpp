#ifndef REARLINK_SERIALIZATION_RESULT_JSON_HPP
#define REARLINK_SERIALIZATION_RESULT_JSON_HPP

#include <nlohmann/json.hpp>
#include <result/linkage_result.hpp>
#include <kinematics/kinematics.hpp>
#include "json_serialization.hpp"
#include "config_json.hpp"

namespace rearlink {

// SolverStep serialization. Points are an array of {id, x, y} so that the
// input order survives; json objects sort their keys.
inline void to_json(nlohmann::json& j, const SolverStep& step) {
    j["step_index"] = step.step_index;
    j["shock_stroke"] = step.shock_stroke;
    j["shock_length"] = step.shock_length;
    j["rear_travel"] = json::optional_json(step.rear_travel);
    j["leverage_ratio"] = json::optional_json(step.leverage_ratio);

    nlohmann::json points = nlohmann::json::array();
    for (const auto& [id, position] : step.points) {
        points.push_back({{"id", id}, {"x", position.x}, {"y", position.y}});
    }
    j["points"] = points;
}

inline void from_json(const nlohmann::json& j, SolverStep& step) {
    step.step_index = j.at("step_index").get<int>();
    step.shock_stroke = j.at("shock_stroke").get<double>();
    step.shock_length = j.at("shock_length").get<double>();
    step.rear_travel = json::optional_value<double>(j, "rear_travel");
    step.leverage_ratio = json::optional_value<double>(j, "leverage_ratio");

    step.points.clear();
    for (const auto& point : j.at("points")) {
        step.points.emplace_back(point.at("id").get<std::string>(),
                                 Vec2(point.at("x").get<double>(), point.at("y").get<double>()));
    }
}

// SolverResult serialization
inline void to_json(nlohmann::json& j, const SolverResult& result) {
    j["rear_axle_point_id"] = json::optional_json(result.rear_axle_point_id);
    j["steps"] = result.steps;
}

inline void from_json(const nlohmann::json& j, SolverResult& result) {
    result.rear_axle_point_id = json::optional_value<std::string>(j, "rear_axle_point_id");
    result.steps = j.at("steps").get<std::vector<SolverStep>>();
}

// ResultSummary serialization
inline void to_json(nlohmann::json& j, const ResultSummary& summary) {
    j = {
        {"step_count", summary.step_count},
        {"total_stroke", summary.total_stroke},
        {"total_travel", json::optional_json(summary.total_travel)},
        {"mean_leverage", json::optional_json(summary.mean_leverage)},
        {"min_leverage", json::optional_json(summary.min_leverage)},
        {"max_leverage", json::optional_json(summary.max_leverage)},
        {"max_driver_residual", summary.max_driver_residual}
    };
}

// BikeSolution: result plus the unit its scalars are expressed in
inline nlohmann::json solution_to_json(const BikeSolution& solution) {
    nlohmann::json j = solution.result;
    j["units"] = solution.units();
    j["scale_mm_per_px"] = json::optional_json(solution.mm_per_px);
    return j;
}

}  // namespace rearlink

#endif // REARLINK_SERIALIZATION_RESULT_JSON_HPP
