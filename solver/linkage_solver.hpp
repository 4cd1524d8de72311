#ifndef REARLINK_LINKAGE_SOLVER_HPP
#define REARLINK_LINKAGE_SOLVER_HPP

#include <linkage/compiled_linkage.hpp>
#include <math/vec2.hpp>
#include <vector>

namespace rearlink {

// Positions of every point, indexed by PointIndex
using Pose = std::vector<Vec2>;

// Configuration for the stroke sweep
struct SolveConfig {
    // Number of stroke increments; the sweep records n_steps + 1 poses
    int n_steps = 80;

    // Gauss-Seidel sweeps over all edges per step
    int iterations = 100;
};

// Position-based distance-constraint solver for a single-shock linkage.
// Sweeps the shock from zero to full stroke and relaxes the linkage at each
// step, starting from the pose of the previous step.
class LinkageSolver {
public:
    // Driver target never drops below this
    static constexpr double kMinTargetLength = 1e-6;

    // Edge length floor used when dividing by the current distance
    static constexpr double kMinDistance = 1e-9;

    // Run the full sweep: returns n_steps + 1 poses, zero to full stroke
    static std::vector<Pose> solve(const CompiledLinkage& linkage,
                                   const SolveConfig& config = SolveConfig{});

    // Clamp n_steps and iterations to at least 1 (logs a warning when clamping)
    static SolveConfig effective_config(const SolveConfig& config);

    // Shock stroke at a given step of an n_steps sweep
    static double stroke_at(const CompiledLinkage& linkage, int step, int n_steps);

    // Driver target length for a given stroke
    static double driver_target(const CompiledLinkage& linkage, double stroke);

    // Relax one pose in place towards the given driver target
    static void relax(const CompiledLinkage& linkage,
                      Pose& pose,
                      double driver_target,
                      int iterations);

private:
    // Project a single edge onto its target length
    static void project_edge(const CompiledLinkage& linkage,
                             Pose& pose,
                             const LinkEdge& edge,
                             double target);
};

}  // namespace rearlink

#endif // REARLINK_LINKAGE_SOLVER_HPP
