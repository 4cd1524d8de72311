#ifndef REARLINK_COMPILED_LINKAGE_HPP
#define REARLINK_COMPILED_LINKAGE_HPP

#include "linkage_edge.hpp"
#include <math/vec2.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rearlink {

class LinkageBuilder;

// Solver-ready form of a linkage.
// Points are addressed by index in input order; ids are kept only for
// lookup and for labelling results. Immutable once built.
class CompiledLinkage {
public:
    // Points
    size_t point_count() const { return point_ids_.size(); }
    const std::vector<std::string>& point_ids() const { return point_ids_; }
    const std::string& point_id(PointIndex index) const { return point_ids_.at(index); }
    const std::vector<Vec2>& initial_positions() const { return initial_positions_; }
    const std::vector<bool>& pinned() const { return pinned_; }
    bool is_pinned(PointIndex index) const { return pinned_.at(index); }

    // Lookup point index by id
    std::optional<PointIndex> index_of(const std::string& point_id) const;

    // Edges in declaration order
    size_t edge_count() const { return edges_.size(); }
    const std::vector<LinkEdge>& edges() const { return edges_; }
    const LinkEdge& edge(EdgeIndex index) const { return edges_.at(index); }

    // Driver (shock)
    EdgeIndex driver_edge_index() const { return driver_edge_; }
    const LinkEdge& driver_edge() const { return edges_.at(driver_edge_); }
    double driver_rest_length() const { return driver_rest_length_; }
    double driver_stroke() const { return driver_stroke_; }

    // Travel reference
    std::optional<PointIndex> rear_axle_index() const { return rear_axle_; }
    std::optional<std::string> rear_axle_id() const;

    size_t pinned_count() const;

private:
    friend class LinkageBuilder;
    CompiledLinkage() = default;

    std::vector<std::string> point_ids_;
    std::vector<Vec2> initial_positions_;
    std::vector<bool> pinned_;
    std::unordered_map<std::string, PointIndex> index_;

    std::vector<LinkEdge> edges_;
    EdgeIndex driver_edge_ = 0;
    double driver_rest_length_ = 0.0;
    double driver_stroke_ = 0.0;

    std::optional<PointIndex> rear_axle_;
};

}  // namespace rearlink

#endif // REARLINK_COMPILED_LINKAGE_HPP
