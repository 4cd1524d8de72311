#ifndef REARLINK_RESULT_AGGREGATOR_HPP
#define REARLINK_RESULT_AGGREGATOR_HPP

#include "linkage_result.hpp"
#include <linkage/compiled_linkage.hpp>
#include <solver/linkage_solver.hpp>
#include <vector>

namespace rearlink {

// Stroke deltas at or below this leave the leverage ratio undefined
constexpr double kMinStrokeDelta = 1e-9;

// Residuals above this fraction of the driver rest length are reported
constexpr double kResidualWarnFraction = 1e-3;

// Derive per-step metrics from the poses of a sweep.
// `poses` holds n_steps + 1 entries as returned by LinkageSolver::solve.
SolverResult aggregate_result(const CompiledLinkage& linkage,
                              const std::vector<Pose>& poses);

// Travel, leverage range and driver residual over a whole sweep
ResultSummary summarize(const CompiledLinkage& linkage, const SolverResult& result);

}  // namespace rearlink

#endif // REARLINK_RESULT_AGGREGATOR_HPP
