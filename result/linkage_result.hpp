#ifndef REARLINK_LINKAGE_RESULT_HPP
#define REARLINK_LINKAGE_RESULT_HPP

#include <math/vec2.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace rearlink {

// Point id -> position, in the order the points were given
using PointPositions = std::vector<std::pair<std::string, Vec2>>;

// State of the linkage at one shock-stroke step.
struct SolverStep {
    int step_index = 0;
    double shock_stroke = 0.0;             // Stroke applied at this step
    double shock_length = 0.0;             // Eye-to-eye after relaxation
    std::optional<double> rear_travel;     // Upward axle travel vs the first pose
    std::optional<double> leverage_ratio;  // d(rear_travel) / d(shock_stroke)
    PointPositions points;                 // pixels, input order

    const Vec2& point(const std::string& id) const {
        for (const auto& [point_id, position] : points) {
            if (point_id == id) return position;
        }
        throw std::out_of_range("Step " + std::to_string(step_index) +
                                " has no point '" + id + "'");
    }
};

// Full sweep from zero to full shock stroke.
struct SolverResult {
    std::optional<std::string> rear_axle_point_id;
    std::vector<SolverStep> steps;
};

// Scalar overview of a sweep
struct ResultSummary {
    size_t step_count = 0;
    double total_stroke = 0.0;
    std::optional<double> total_travel;
    std::optional<double> mean_leverage;   // total_travel / total_stroke
    std::optional<double> min_leverage;
    std::optional<double> max_leverage;
    double max_driver_residual = 0.0;      // max |shock_length - target|
};

}  // namespace rearlink

#endif // REARLINK_LINKAGE_RESULT_HPP
