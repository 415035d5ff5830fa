#pragma once

#include <scene_graph/touch.hpp>
#include <cstdint>
#include <cstddef>
#include <map>
#include <optional>
#include <utility>

namespace scene_graph {

enum class TouchSource { Mouse, Finger, Scripted };

// Maps device-specific ids (SDL finger ids, the mouse, scripted input) to
// dispatcher touch ids. Ids are handed out sequentially, so two live inputs
// never share one whatever their raw ids are.
class TouchIdMap {
public:
    // Id for an input that is starting or already down.
    TouchId acquire(TouchSource source, std::uint64_t source_id);
    std::optional<TouchId> find(TouchSource source, std::uint64_t source_id) const;
    // Forgets the input; returns the id it had, if any.
    std::optional<TouchId> release(TouchSource source, std::uint64_t source_id);
    void clear() { ids_.clear(); }

    std::size_t size() const { return ids_.size(); }

private:
    std::map<std::pair<TouchSource, std::uint64_t>, TouchId> ids_;
    TouchId next_id_ = 0;
};

} // namespace scene_graph
