#include "compiled_linkage.hpp"

namespace rearlink {

std::optional<PointIndex> CompiledLinkage::index_of(const std::string& point_id) const {
    auto it = index_.find(point_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> CompiledLinkage::rear_axle_id() const {
    if (!rear_axle_) {
        return std::nullopt;
    }
    return point_ids_[*rear_axle_];
}

size_t CompiledLinkage::pinned_count() const {
    size_t count = 0;
    for (bool p : pinned_) {
        if (p) ++count;
    }
    return count;
}

}  // namespace rearlink
