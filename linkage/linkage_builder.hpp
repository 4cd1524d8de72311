#ifndef REARLINK_LINKAGE_BUILDER_HPP
#define REARLINK_LINKAGE_BUILDER_HPP

#include "compiled_linkage.hpp"
#include "linkage_point.hpp"
#include "linkage_body.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rearlink {

// Builder for compiling points and rigid bodies into a CompiledLinkage.
// Every malformed input raises a LinkageError subclass; nothing is coerced.
class LinkageBuilder {
public:
    static CompiledLinkage build(const std::vector<LinkagePoint>& points,
                                 const std::vector<RigidBody>& bodies);

private:
    explicit LinkageBuilder(const std::vector<LinkagePoint>& points);

    void index_points();
    void add_body(const RigidBody& body);
    void pin_members(const RigidBody& body);
    void add_shock_edge(const RigidBody& body, PointIndex a, PointIndex b, double geometric_length);
    void check_driver() const;

    PointIndex resolve(const RigidBody& body, const std::string& point_id) const;

    // Consecutive pairs, plus the wrap-around pair for closed chains
    static std::vector<std::pair<std::string, std::string>> segment_pairs(const RigidBody& body);

    const std::vector<LinkagePoint>& points_;
    std::optional<std::string> driver_body_;
    CompiledLinkage linkage_;
};

}  // namespace rearlink

#endif // REARLINK_LINKAGE_BUILDER_HPP
