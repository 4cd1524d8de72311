#ifndef REARLINK_UNITS_BIKE_SCALE_HPP
#define REARLINK_UNITS_BIKE_SCALE_HPP

#include <linkage/linkage_point.hpp>
#include <linkage/linkage_body.hpp>
#include <result/linkage_result.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace rearlink {

// Invalid or missing scale information
class UnitsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Real-world calibration of the bike photo.
struct BikeGeometry {
    // Chainstay length, bottom bracket to rear axle
    std::optional<double> rear_center_mm;

    // Takes precedence over rear_center_mm when set
    std::optional<double> scale_mm_per_px;
};

// Unit of a shock body's stroke and length0
enum class ShockUnits {
    Pixels,
    Millimeters
};

const char* shock_units_name(ShockUnits units);
ShockUnits parse_shock_units(std::string_view name);

// Millimeters per pixel, if the geometry allows deriving it.
// The explicit scale wins; otherwise rear_center_mm is divided by the pixel
// distance between the bottom bracket and the rear axle.
std::optional<double> resolve_scale(const BikeGeometry& geometry,
                                    const std::vector<LinkagePoint>& points);

// Copy of `bodies` with the shock's stroke and length0 converted from mm to pixels
std::vector<RigidBody> shock_to_pixels(const std::vector<RigidBody>& bodies,
                                       double mm_per_px);

// Convert stroke, length and travel of every step to millimeters.
// Point coordinates stay in pixels; leverage ratio is dimensionless.
void result_to_millimeters(SolverResult& result, double mm_per_px);

void summary_to_millimeters(ResultSummary& summary, double mm_per_px);

}  // namespace rearlink

#endif // REARLINK_UNITS_BIKE_SCALE_HPP
