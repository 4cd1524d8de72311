#ifndef REARLINK_SERIALIZATION_LINKAGE_JSON_HPP
#define REARLINK_SERIALIZATION_LINKAGE_JSON_HPP

#include <nlohmann/json.hpp>
#include <kinematics/kinematics.hpp>
#include <linkage/linkage_point.hpp>
#include <linkage/linkage_body.hpp>
#include <units/bike_scale.hpp>
#include <common/logging.hpp>
#include "json_serialization.hpp"
#include "config_json.hpp"
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace rearlink {

// Type enums go through parse_point_type / parse_body_type rather than
// NLOHMANN_JSON_SERIALIZE_ENUM, which maps unknown strings to the first value.

inline void to_json(nlohmann::json& j, const LinkagePoint& point) {
    j["id"] = point.id;
    j["type"] = point_type_name(point.type);
    j["x"] = point.position.x;
    j["y"] = point.position.y;
    if (point.name) j["name"] = *point.name;
}

inline void from_json(const nlohmann::json& j, LinkagePoint& point) {
    point.id = j.at("id").get<std::string>();
    point.type = parse_point_type(j.at("type").get<std::string>());
    point.position.x = j.at("x").get<double>();
    point.position.y = j.at("y").get<double>();
    point.name = json::optional_value<std::string>(j, "name");
}

inline void to_json(nlohmann::json& j, const RigidBody& body) {
    j["id"] = body.id;
    if (body.name) j["name"] = *body.name;
    j["point_ids"] = body.point_ids;
    j["type"] = body_type_name(body.type);
    j["closed"] = body.closed;
    if (body.length0) j["length0"] = *body.length0;
    if (body.stroke) j["stroke"] = *body.stroke;
}

inline void from_json(const nlohmann::json& j, RigidBody& body) {
    body.id = j.at("id").get<std::string>();
    body.name = json::optional_value<std::string>(j, "name");
    if (j.contains("point_ids") && !j["point_ids"].is_null()) {
        body.point_ids = j["point_ids"].get<std::vector<std::string>>();
    }

    // An untyped body is a plain bar
    auto type = json::optional_value<std::string>(j, "type");
    body.type = type ? parse_body_type(*type) : BodyType::Bar;

    body.closed = j.value("closed", false);
    body.length0 = json::optional_value<double>(j, "length0");
    body.stroke = json::optional_value<double>(j, "stroke");
}

inline void to_json(nlohmann::json& j, const BikeGeometry& geometry) {
    j = {
        {"rear_center_mm", json::optional_json(geometry.rear_center_mm)},
        {"scale_mm_per_px", json::optional_json(geometry.scale_mm_per_px)}
    };
}

inline void from_json(const nlohmann::json& j, BikeGeometry& geometry) {
    geometry.rear_center_mm = json::optional_value<double>(j, "rear_center_mm");
    geometry.scale_mm_per_px = json::optional_value<double>(j, "scale_mm_per_px");
}

inline void to_json(nlohmann::json& j, const BikeDocument& bike) {
    j["points"] = bike.points;
    j["bodies"] = bike.bodies;
    j["geometry"] = bike.geometry;
    j["shock_units"] = shock_units_name(bike.shock_units);
}

inline void from_json(const nlohmann::json& j, BikeDocument& bike) {
    if (j.contains("points")) {
        bike.points = j["points"].get<std::vector<LinkagePoint>>();
    }
    if (j.contains("bodies")) {
        bike.bodies = j["bodies"].get<std::vector<RigidBody>>();
    }
    if (j.contains("geometry") && !j["geometry"].is_null()) {
        bike.geometry = j["geometry"].get<BikeGeometry>();
    }
    bike.shock_units = parse_shock_units(j.value("shock_units", "px"));
}

// Contents of a {"bikes": {name: document}} file. A document that fails to
// parse is kept as a failed entry, so one bad bike does not sink the batch.
struct BikeBatch {
    std::vector<std::pair<std::string, BikeDocument>> bikes;
    std::vector<BatchEntry> rejected;
};

inline BikeBatch read_bike_batch(const nlohmann::json& j) {
    auto log = rearlink::logging::get_logger();
    const auto& bikes = j.at("bikes");
    if (!bikes.is_object()) {
        throw std::runtime_error("'bikes' must map bike names to documents");
    }

    BikeBatch batch;
    for (const auto& [name, bike_j] : bikes.items()) {
        try {
            batch.bikes.emplace_back(name, bike_j.get<BikeDocument>());
        } catch (const std::exception& e) {
            log->error("Batch: bike '{}' could not be read: {}", name, e.what());
            BatchEntry entry;
            entry.name = name;
            entry.error = e.what();
            batch.rejected.push_back(std::move(entry));
        }
    }
    return batch;
}

}  // namespace rearlink

#endif // REARLINK_SERIALIZATION_LINKAGE_JSON_HPP
