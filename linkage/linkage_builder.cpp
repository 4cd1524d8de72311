#include "linkage_builder.hpp"
#include "linkage_error.hpp"
#include "logging.hpp"

namespace rearlink {

CompiledLinkage LinkageBuilder::build(const std::vector<LinkagePoint>& points,
                                      const std::vector<RigidBody>& bodies) {
    if (points.empty()) {
        throw EmptyLinkageError("No points defined for this linkage");
    }
    if (bodies.empty()) {
        throw EmptyLinkageError("No rigid bodies defined for this linkage");
    }

    LinkageBuilder builder(points);
    builder.index_points();
    for (const auto& body : bodies) {
        builder.add_body(body);
    }
    builder.check_driver();

    auto log = rearlink::logging::get_logger();
    log->info("LinkageBuilder: compiled {} points ({} pinned), {} edges, driver '{}' "
              "rest={:.3f} stroke={:.3f}",
              builder.linkage_.point_count(),
              builder.linkage_.pinned_count(),
              builder.linkage_.edge_count(),
              *builder.driver_body_,
              builder.linkage_.driver_rest_length(),
              builder.linkage_.driver_stroke());

    return std::move(builder.linkage_);
}

LinkageBuilder::LinkageBuilder(const std::vector<LinkagePoint>& points)
    : points_(points) {
}

void LinkageBuilder::index_points() {
    auto log = rearlink::logging::get_logger();

    linkage_.point_ids_.reserve(points_.size());
    linkage_.initial_positions_.reserve(points_.size());
    linkage_.pinned_.reserve(points_.size());

    for (size_t i = 0; i < points_.size(); ++i) {
        const auto& point = points_[i];
        auto index = static_cast<PointIndex>(i);

        if (!linkage_.index_.emplace(point.id, index).second) {
            throw DuplicatePointError(point.id);
        }

        linkage_.point_ids_.push_back(point.id);
        linkage_.initial_positions_.push_back(point.position);
        linkage_.pinned_.push_back(point.is_pinned());

        if (point.type == PointType::RearAxle) {
            if (!linkage_.rear_axle_) {
                linkage_.rear_axle_ = index;
            } else {
                log->warn("LinkageBuilder: extra rear axle '{}' ignored, using '{}'",
                          point.id, linkage_.point_ids_[*linkage_.rear_axle_]);
            }
        }
    }
}

void LinkageBuilder::add_body(const RigidBody& body) {
    auto log = rearlink::logging::get_logger();

    if (body.point_ids.size() < 2) {
        log->debug("LinkageBuilder: skipping body '{}' with {} point(s)",
                   body.id, body.point_ids.size());
        return;
    }

    if (body.is_shock() && body.point_ids.size() != 2) {
        throw InvalidShockError(body.id, body.point_ids.size());
    }

    if (body.type == BodyType::Fixed) {
        pin_members(body);
    }

    for (const auto& [a_id, b_id] : segment_pairs(body)) {
        PointIndex a = resolve(body, a_id);
        PointIndex b = resolve(body, b_id);
        double geometric_length =
            linkage_.initial_positions_[a].distance_to(linkage_.initial_positions_[b]);

        if (body.is_shock()) {
            add_shock_edge(body, a, b, geometric_length);
            continue;
        }

        LinkEdge edge;
        edge.point_a = a;
        edge.point_b = b;
        edge.rest_length = body.length0.value_or(geometric_length);
        edge.is_driver = false;
        linkage_.edges_.push_back(edge);
    }

    log->debug("LinkageBuilder: body '{}' ({}) -> {} edges total",
               body.id, body_type_name(body.type), linkage_.edges_.size());
}

void LinkageBuilder::pin_members(const RigidBody& body) {
    for (const auto& point_id : body.point_ids) {
        linkage_.pinned_[resolve(body, point_id)] = true;
    }
}

void LinkageBuilder::add_shock_edge(const RigidBody& body, PointIndex a, PointIndex b,
                                    double geometric_length) {
    if (!body.stroke) {
        throw MissingStrokeError(body.id);
    }
    if (driver_body_) {
        throw MultipleShocksError(*driver_body_, body.id);
    }

    LinkEdge edge;
    edge.point_a = a;
    edge.point_b = b;
    edge.rest_length = body.length0.value_or(geometric_length);
    edge.is_driver = true;
    linkage_.edges_.push_back(edge);

    driver_body_ = body.id;
    linkage_.driver_edge_ = static_cast<EdgeIndex>(linkage_.edges_.size() - 1);
    linkage_.driver_rest_length_ = edge.rest_length;
    linkage_.driver_stroke_ = *body.stroke;
}

void LinkageBuilder::check_driver() const {
    if (!driver_body_) {
        throw MissingShockError();
    }
}

PointIndex LinkageBuilder::resolve(const RigidBody& body, const std::string& point_id) const {
    auto index = linkage_.index_of(point_id);
    if (!index) {
        throw UnknownPointError(body.id, point_id);
    }
    return *index;
}

std::vector<std::pair<std::string, std::string>> LinkageBuilder::segment_pairs(const RigidBody& body) {
    const auto& ids = body.point_ids;
    std::vector<std::pair<std::string, std::string>> pairs;
    for (size_t i = 0; i + 1 < ids.size(); ++i) {
        pairs.emplace_back(ids[i], ids[i + 1]);
    }
    if (body.closed && ids.size() > 2) {
        pairs.emplace_back(ids.back(), ids.front());
    }
    return pairs;
}

}  // namespace rearlink
