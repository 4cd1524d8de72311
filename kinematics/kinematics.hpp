#ifndef REARLINK_KINEMATICS_HPP
#define REARLINK_KINEMATICS_HPP

#include <linkage/linkage_point.hpp>
#include <linkage/linkage_body.hpp>
#include <solver/linkage_solver.hpp>
#include <result/linkage_result.hpp>
#include <units/bike_scale.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rearlink {

// Everything the solver needs to know about one bike.
struct BikeDocument {
    std::vector<LinkagePoint> points;
    std::vector<RigidBody> bodies;
    BikeGeometry geometry;
    ShockUnits shock_units = ShockUnits::Pixels;
};

// Solution of one bike, with scalar outputs in millimeters when a scale
// could be resolved and in pixels otherwise.
struct BikeSolution {
    SolverResult result;
    ResultSummary summary;
    std::optional<double> mm_per_px;

    const char* units() const { return mm_per_px ? "mm" : "px"; }
};

// Bodies ready for LinkageBuilder, with a millimeter shock converted to
// pixels at mm_per_px. Throws UnitsError for a millimeter shock without scale.
std::vector<RigidBody> prepare_bodies(const BikeDocument& bike,
                                      std::optional<double> mm_per_px);

// Compile, sweep and aggregate in one call. All values in the unit of the
// point coordinates.
SolverResult solve_linkage(const std::vector<LinkagePoint>& points,
                           const std::vector<RigidBody>& bodies,
                           const SolveConfig& config = SolveConfig{});

// solve_linkage plus unit handling: a millimeter shock is converted to pixels
// before solving, and scalar outputs are converted back to millimeters.
BikeSolution solve_bike(const BikeDocument& bike,
                        const SolveConfig& config = SolveConfig{});

struct BatchConfig {
    int num_threads = 0;  // 0 = OpenMP default, > 0 = use specific count
};

// Outcome of one bike in a batch; exactly one of solution / error is set.
struct BatchEntry {
    std::string name;
    std::optional<BikeSolution> solution;
    std::optional<std::string> error;
};

// Solve independent bikes concurrently. A failing bike does not stop the
// others; its error message is recorded in its entry.
std::vector<BatchEntry> solve_batch(
    const std::vector<std::pair<std::string, BikeDocument>>& bikes,
    const SolveConfig& config = SolveConfig{},
    const BatchConfig& batch = BatchConfig{});

}  // namespace rearlink

#endif // REARLINK_KINEMATICS_HPP
