#ifndef REARLINK_LINKAGE_POINT_HPP
#define REARLINK_LINKAGE_POINT_HPP

#include <math/vec2.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace rearlink {

// Role of a pivot point on the frame.
enum class PointType {
    BottomBracket,  // Pinned to the front triangle
    RearAxle,       // Travel measurement reference
    FrontAxle,
    Free,
    Fixed           // Pinned to the front triangle
};

// An identified pivot location in image space.
struct LinkagePoint {
    std::string id;
    PointType type = PointType::Free;
    Vec2 position;
    std::optional<std::string> name;

    bool is_pinned() const {
        return type == PointType::Fixed || type == PointType::BottomBracket;
    }
};

// Wire names: "bb", "rear_axle", "front_axle", "free", "fixed"
const char* point_type_name(PointType type);

// Throws UnknownTypeError for anything outside the closed vocabulary
PointType parse_point_type(std::string_view name);

}  // namespace rearlink

#endif // REARLINK_LINKAGE_POINT_HPP
