#ifndef REARLINK_LINKAGE_EDGE_HPP
#define REARLINK_LINKAGE_EDGE_HPP

#include <cstdint>

namespace rearlink {

using PointIndex = uint32_t;
using EdgeIndex = uint32_t;

// One distance constraint between two points of the linkage.
struct LinkEdge {
    PointIndex point_a = 0;
    PointIndex point_b = 0;
    double rest_length = 0.0;
    bool is_driver = false;
};

}  // namespace rearlink

#endif // REARLINK_LINKAGE_EDGE_HPP
