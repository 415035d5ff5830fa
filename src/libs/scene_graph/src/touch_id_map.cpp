#include <scene_graph/touch_id_map.hpp>

namespace scene_graph {

TouchId TouchIdMap::acquire(TouchSource source, std::uint64_t source_id) {
    auto [it, inserted] = ids_.try_emplace(std::make_pair(source, source_id), next_id_);
    if (inserted) ++next_id_;
    return it->second;
}

std::optional<TouchId> TouchIdMap::find(TouchSource source, std::uint64_t source_id) const {
    auto it = ids_.find(std::make_pair(source, source_id));
    if (it == ids_.end()) return std::nullopt;
    return it->second;
}

std::optional<TouchId> TouchIdMap::release(TouchSource source, std::uint64_t source_id) {
    auto it = ids_.find(std::make_pair(source, source_id));
    if (it == ids_.end()) return std::nullopt;
    const TouchId id = it->second;
    ids_.erase(it);
    return id;
}

} // namespace scene_graph
