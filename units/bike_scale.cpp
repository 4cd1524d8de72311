#include "bike_scale.hpp"
#include "logging.hpp"
#include <cmath>

namespace rearlink {

namespace {

void check_positive(double value, const char* what) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw UnitsError(std::string(what) + " must be a positive number, got " +
                         std::to_string(value));
    }
}

const LinkagePoint* first_of_type(const std::vector<LinkagePoint>& points, PointType type) {
    for (const auto& point : points) {
        if (point.type == type) {
            return &point;
        }
    }
    return nullptr;
}

}  // namespace

const char* shock_units_name(ShockUnits units) {
    switch (units) {
        case ShockUnits::Pixels:      return "px";
        case ShockUnits::Millimeters: return "mm";
    }
    return "px";
}

ShockUnits parse_shock_units(std::string_view name) {
    if (name == "px") return ShockUnits::Pixels;
    if (name == "mm") return ShockUnits::Millimeters;
    throw UnitsError("Unknown units '" + std::string(name) + "', expected 'px' or 'mm'");
}

std::optional<double> resolve_scale(const BikeGeometry& geometry,
                                    const std::vector<LinkagePoint>& points) {
    auto log = rearlink::logging::get_logger();

    if (geometry.scale_mm_per_px) {
        check_positive(*geometry.scale_mm_per_px, "scale_mm_per_px");
        return geometry.scale_mm_per_px;
    }

    if (!geometry.rear_center_mm) {
        return std::nullopt;
    }
    check_positive(*geometry.rear_center_mm, "rear_center_mm");

    const LinkagePoint* bb = first_of_type(points, PointType::BottomBracket);
    const LinkagePoint* axle = first_of_type(points, PointType::RearAxle);
    if (!bb || !axle) {
        log->debug("rear_center_mm given but bottom bracket or rear axle point is missing");
        return std::nullopt;
    }

    double rear_center_px = bb->position.distance_to(axle->position);
    if (rear_center_px <= 0.0) {
        throw UnitsError("Bottom bracket '" + bb->id + "' and rear axle '" + axle->id +
                         "' coincide; cannot derive scale from rear_center_mm");
    }

    double scale = *geometry.rear_center_mm / rear_center_px;
    log->debug("Derived scale {:.5f} mm/px from rear center {:.1f} mm over {:.1f} px",
               scale, *geometry.rear_center_mm, rear_center_px);
    return scale;
}

std::vector<RigidBody> shock_to_pixels(const std::vector<RigidBody>& bodies,
                                       double mm_per_px) {
    check_positive(mm_per_px, "scale_mm_per_px");

    std::vector<RigidBody> converted = bodies;
    for (auto& body : converted) {
        if (!body.is_shock()) {
            continue;
        }
        if (body.stroke) {
            body.stroke = *body.stroke / mm_per_px;
        }
        if (body.length0) {
            body.length0 = *body.length0 / mm_per_px;
        }
    }
    return converted;
}

void result_to_millimeters(SolverResult& result, double mm_per_px) {
    check_positive(mm_per_px, "scale_mm_per_px");

    for (auto& step : result.steps) {
        step.shock_stroke *= mm_per_px;
        step.shock_length *= mm_per_px;
        if (step.rear_travel) {
            *step.rear_travel *= mm_per_px;
        }
    }
}

void summary_to_millimeters(ResultSummary& summary, double mm_per_px) {
    check_positive(mm_per_px, "scale_mm_per_px");

    summary.total_stroke *= mm_per_px;
    if (summary.total_travel) {
        *summary.total_travel *= mm_per_px;
    }
    summary.max_driver_residual *= mm_per_px;
}

}  // namespace rearlink
