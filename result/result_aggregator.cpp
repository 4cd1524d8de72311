#include "result_aggregator.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace rearlink {

SolverResult aggregate_result(const CompiledLinkage& linkage,
                              const std::vector<Pose>& poses) {
    if (poses.size() < 2) {
        throw std::runtime_error("Result aggregation needs at least two poses, got " +
                                 std::to_string(poses.size()));
    }

    const int n_steps = static_cast<int>(poses.size()) - 1;
    const LinkEdge& driver = linkage.driver_edge();
    const auto rear_axle = linkage.rear_axle_index();
    const auto& ids = linkage.point_ids();

    SolverResult result;
    result.rear_axle_point_id = linkage.rear_axle_id();
    result.steps.reserve(poses.size());

    for (int i = 0; i <= n_steps; ++i) {
        const Pose& pose = poses[static_cast<size_t>(i)];

        SolverStep step;
        step.step_index = i;
        step.shock_stroke = LinkageSolver::stroke_at(linkage, i, n_steps);
        step.shock_length = pose[driver.point_a].distance_to(pose[driver.point_b]);

        if (rear_axle) {
            // Image y grows downwards, so upward travel is y0 - y
            step.rear_travel = linkage.initial_positions()[*rear_axle].y - pose[*rear_axle].y;
        }

        if (i > 0) {
            const SolverStep& prev = result.steps.back();
            double ds = step.shock_stroke - prev.shock_stroke;
            if (step.rear_travel && prev.rear_travel && std::abs(ds) > kMinStrokeDelta) {
                step.leverage_ratio = (*step.rear_travel - *prev.rear_travel) / ds;
            }
        }

        step.points.reserve(ids.size());
        for (size_t p = 0; p < ids.size(); ++p) {
            step.points.emplace_back(ids[p], pose[p]);
        }

        result.steps.push_back(std::move(step));
    }

    return result;
}

ResultSummary summarize(const CompiledLinkage& linkage, const SolverResult& result) {
    auto log = rearlink::logging::get_logger();
    ResultSummary summary;
    summary.step_count = result.steps.size();

    if (result.steps.empty()) {
        return summary;
    }

    const SolverStep& last = result.steps.back();
    summary.total_stroke = last.shock_stroke;
    summary.total_travel = last.rear_travel;

    if (summary.total_travel && std::abs(summary.total_stroke) > kMinStrokeDelta) {
        summary.mean_leverage = *summary.total_travel / summary.total_stroke;
    }

    for (const auto& step : result.steps) {
        double target = LinkageSolver::driver_target(linkage, step.shock_stroke);
        summary.max_driver_residual =
            std::max(summary.max_driver_residual, std::abs(step.shock_length - target));

        if (step.leverage_ratio) {
            double lr = *step.leverage_ratio;
            summary.min_leverage = summary.min_leverage ? std::min(*summary.min_leverage, lr) : lr;
            summary.max_leverage = summary.max_leverage ? std::max(*summary.max_leverage, lr) : lr;
        }
    }

    // Not an error: the sweep is best effort for over-constrained linkages
    if (summary.max_driver_residual > kResidualWarnFraction * linkage.driver_rest_length()) {
        log->warn("Shock length deviates from its target by up to {:.4f}; "
                  "the linkage may be over-constrained or need more iterations",
                  summary.max_driver_residual);
    }

    return summary;
}

}  // namespace rearlink
