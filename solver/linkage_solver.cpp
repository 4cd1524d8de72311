#include "linkage_solver.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>

namespace rearlink {

std::vector<Pose> LinkageSolver::solve(const CompiledLinkage& linkage,
                                       const SolveConfig& config) {
    auto log = rearlink::logging::get_logger();
    SolveConfig effective = effective_config(config);

    log->info("LinkageSolver: sweeping stroke 0 -> {:.3f} in {} steps, {} iterations per step",
              linkage.driver_stroke(), effective.n_steps, effective.iterations);

    // Position arena, carried over from step to step
    Pose pose = linkage.initial_positions();

    std::vector<Pose> poses;
    poses.reserve(static_cast<size_t>(effective.n_steps) + 1);

    const LinkEdge& driver = linkage.driver_edge();

    for (int step = 0; step <= effective.n_steps; ++step) {
        double stroke = stroke_at(linkage, step, effective.n_steps);
        double target = driver_target(linkage, stroke);

        relax(linkage, pose, target, effective.iterations);

        if (log->should_log(spdlog::level::trace)) {
            double length = pose[driver.point_a].distance_to(pose[driver.point_b]);
            log->trace("LinkageSolver: step {} stroke={:.4f} target={:.4f} length={:.4f}",
                       step, stroke, target, length);
        }

        poses.push_back(pose);
    }

    log->info("LinkageSolver: recorded {} poses", poses.size());
    return poses;
}

SolveConfig LinkageSolver::effective_config(const SolveConfig& config) {
    auto log = rearlink::logging::get_logger();
    SolveConfig effective = config;

    if (effective.n_steps < 1) {
        log->warn("LinkageSolver: n_steps={} is below 1, using 1", effective.n_steps);
        effective.n_steps = 1;
    }
    if (effective.iterations < 1) {
        log->warn("LinkageSolver: iterations={} is below 1, using 1", effective.iterations);
        effective.iterations = 1;
    }
    return effective;
}

double LinkageSolver::stroke_at(const CompiledLinkage& linkage, int step, int n_steps) {
    return linkage.driver_stroke() * (static_cast<double>(step) / static_cast<double>(n_steps));
}

double LinkageSolver::driver_target(const CompiledLinkage& linkage, double stroke) {
    // Shock shortens with positive stroke
    return std::max(kMinTargetLength, linkage.driver_rest_length() - stroke);
}

void LinkageSolver::relax(const CompiledLinkage& linkage,
                          Pose& pose,
                          double driver_target,
                          int iterations) {
    const auto& edges = linkage.edges();

    // Gauss-Seidel: each edge sees the corrections of the edges before it,
    // so declaration order must be preserved.
    for (int iter = 0; iter < iterations; ++iter) {
        for (const auto& edge : edges) {
            double target = edge.is_driver ? driver_target : edge.rest_length;
            project_edge(linkage, pose, edge, target);
        }
    }
}

void LinkageSolver::project_edge(const CompiledLinkage& linkage,
                                 Pose& pose,
                                 const LinkEdge& edge,
                                 double target) {
    const auto& pinned = linkage.pinned();
    bool pinned_a = pinned[edge.point_a];
    bool pinned_b = pinned[edge.point_b];

    // Frame-to-frame edges never move
    if (pinned_a && pinned_b) {
        return;
    }

    Vec2& a = pose[edge.point_a];
    Vec2& b = pose[edge.point_b];

    Vec2 delta = b - a;
    double current_dist = std::max(delta.length(), kMinDistance);
    double correction = (current_dist - target) / current_dist;
    Vec2 correction_vec = delta * correction;

    if (pinned_a) {
        // Only move b
        b -= correction_vec;
    } else if (pinned_b) {
        // Only move a
        a += correction_vec;
    } else {
        // Move both equally
        correction_vec *= 0.5;
        a += correction_vec;
        b -= correction_vec;
    }
}

}  // namespace rearlink
