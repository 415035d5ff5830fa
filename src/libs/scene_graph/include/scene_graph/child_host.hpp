#pragma once

#include <scene_graph/types.hpp>
#include <memory>

namespace scene_graph {

class Node;

// What a widget needs from the scene graph to swap its visuals: a place to hang
// children and a hit test. Point is in the host's parent coordinate space.
class ChildHost {
public:
    virtual ~ChildHost() = default;

    virtual void attach_child(std::shared_ptr<Node> child) = 0;
    virtual void detach_child(Node& child) = 0;
    virtual bool contains_point(Point point) const = 0;
};

} // namespace scene_graph
