#include "kinematics.hpp"
#include "logging.hpp"
#include <linkage/linkage_builder.hpp>
#include <result/result_aggregator.hpp>
#include <exception>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace rearlink {

SolverResult solve_linkage(const std::vector<LinkagePoint>& points,
                           const std::vector<RigidBody>& bodies,
                           const SolveConfig& config) {
    CompiledLinkage linkage = LinkageBuilder::build(points, bodies);
    std::vector<Pose> poses = LinkageSolver::solve(linkage, config);
    return aggregate_result(linkage, poses);
}

std::vector<RigidBody> prepare_bodies(const BikeDocument& bike,
                                      std::optional<double> mm_per_px) {
    if (bike.shock_units == ShockUnits::Pixels) {
        return bike.bodies;
    }
    if (!mm_per_px) {
        throw UnitsError("Shock is given in millimeters but no scale is available; "
                         "set geometry.scale_mm_per_px or geometry.rear_center_mm");
    }

    auto log = rearlink::logging::get_logger();
    log->debug("Converted shock from mm to px at {:.5f} mm/px", *mm_per_px);
    return shock_to_pixels(bike.bodies, *mm_per_px);
}

BikeSolution solve_bike(const BikeDocument& bike, const SolveConfig& config) {
    BikeSolution solution;
    solution.mm_per_px = resolve_scale(bike.geometry, bike.points);

    std::vector<RigidBody> bodies = prepare_bodies(bike, solution.mm_per_px);

    CompiledLinkage linkage = LinkageBuilder::build(bike.points, bodies);
    std::vector<Pose> poses = LinkageSolver::solve(linkage, config);
    solution.result = aggregate_result(linkage, poses);

    // Residual is measured against pixel targets, so summarize before converting
    solution.summary = summarize(linkage, solution.result);

    if (solution.mm_per_px) {
        result_to_millimeters(solution.result, *solution.mm_per_px);
        summary_to_millimeters(solution.summary, *solution.mm_per_px);
    }

    return solution;
}

std::vector<BatchEntry> solve_batch(
    const std::vector<std::pair<std::string, BikeDocument>>& bikes,
    const SolveConfig& config,
    const BatchConfig& batch) {
    auto log = rearlink::logging::get_logger();

    #ifdef _OPENMP
    int use_threads = (batch.num_threads > 0) ? batch.num_threads : omp_get_max_threads();
    log->info("Batch: solving {} bikes with {} OpenMP threads", bikes.size(), use_threads);
    #else
    (void)batch;
    log->info("Batch: solving {} bikes single-threaded (OpenMP not available)", bikes.size());
    #endif

    std::vector<BatchEntry> entries(bikes.size());

    // Each solve owns its own position arena; entries are written by index only
    #pragma omp parallel for schedule(dynamic) num_threads(use_threads)
    for (long i = 0; i < static_cast<long>(bikes.size()); ++i) {
        const auto& [name, bike] = bikes[static_cast<size_t>(i)];
        BatchEntry& entry = entries[static_cast<size_t>(i)];
        entry.name = name;
        try {
            entry.solution = solve_bike(bike, config);
        } catch (const std::exception& e) {
            log->error("Batch: bike '{}' failed: {}", name, e.what());
            entry.error = e.what();
        }
    }

    size_t failed = 0;
    for (const auto& entry : entries) {
        if (entry.error) ++failed;
    }
    log->info("Batch: {} solved, {} failed", entries.size() - failed, failed);

    return entries;
}

}  // namespace rearlink
