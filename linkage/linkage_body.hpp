#ifndef REARLINK_LINKAGE_BODY_HPP
#define REARLINK_LINKAGE_BODY_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rearlink {

// Kind of rigid body
enum class BodyType {
    Bar,    // Fixed-length links between moving pivots
    Shock,  // The single driver; shortens with stroke
    Fixed,  // Frame cluster, pins every member point
    Other
};

// An ordered chain of points forming one or more segments.
// Consecutive ids are joined; `closed` adds a last -> first segment.
struct RigidBody {
    std::string id;
    std::optional<std::string> name;
    std::vector<std::string> point_ids;
    BodyType type = BodyType::Bar;
    bool closed = false;

    // Rest length override (eye-to-eye for a shock at zero stroke)
    std::optional<double> length0;

    // Total shock stroke, same unit as length0 / coordinates
    std::optional<double> stroke;

    bool is_shock() const { return type == BodyType::Shock; }
};

// Wire names: "bar", "shock", "fixed", "other"
const char* body_type_name(BodyType type);

// Throws UnknownTypeError for anything outside the closed vocabulary
BodyType parse_body_type(std::string_view name);

}  // namespace rearlink

#endif // REARLINK_LINKAGE_BODY_HPP
