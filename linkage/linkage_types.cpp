#include "linkage_point.hpp"
#include "linkage_body.hpp"
#include "linkage_error.hpp"
#include <string>

namespace rearlink {

const char* point_type_name(PointType type) {
    switch (type) {
        case PointType::BottomBracket: return "bb";
        case PointType::RearAxle:      return "rear_axle";
        case PointType::FrontAxle:     return "front_axle";
        case PointType::Free:          return "free";
        case PointType::Fixed:         return "fixed";
    }
    return "free";
}

PointType parse_point_type(std::string_view name) {
    if (name == "bb") return PointType::BottomBracket;
    if (name == "rear_axle") return PointType::RearAxle;
    if (name == "front_axle") return PointType::FrontAxle;
    if (name == "free") return PointType::Free;
    if (name == "fixed") return PointType::Fixed;
    throw UnknownTypeError("point", std::string(name));
}

const char* body_type_name(BodyType type) {
    switch (type) {
        case BodyType::Bar:   return "bar";
        case BodyType::Shock: return "shock";
        case BodyType::Fixed: return "fixed";
        case BodyType::Other: return "other";
    }
    return "other";
}

BodyType parse_body_type(std::string_view name) {
    if (name == "bar") return BodyType::Bar;
    if (name == "shock") return BodyType::Shock;
    if (name == "fixed") return BodyType::Fixed;
    if (name == "other") return BodyType::Other;
    throw UnknownTypeError("body", std::string(name));
}

}  // namespace rearlink
