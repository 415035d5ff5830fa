#pragma once

#include <scene_graph/types.hpp>
#include <cstdint>

namespace scene_graph {

using TouchId = std::uint64_t;

// Locations are in scene (root) space.
struct Touch {
    TouchId id = 0;
    Point location;
    Point previous_location;
};

} // namespace scene_graph
