#pragma once

#include <scene_graph/node.hpp>
#include <scene_graph/touch.hpp>
#include <cstddef>
#include <memory>
#include <unordered_map>

namespace scene_graph {

// Input-dispatch pass: a touch goes to the node it began on until it ends or is
// cancelled, wherever it moves in between.
class TouchDispatcher {
public:
    TouchDispatcher();
    explicit TouchDispatcher(std::shared_ptr<Node> root);

    void set_root(std::shared_ptr<Node> root);
    const std::shared_ptr<Node>& root() const { return root_; }

    // Deepest node with user interaction enabled under the point; topmost
    // (last attached) children win. Null if nothing interactive is hit.
    std::shared_ptr<Node> hit_test(Point scene_point) const;

    bool touch_began(const Touch& touch);
    void touch_moved(const Touch& touch);
    void touch_ended(const Touch& touch);
    void touch_cancelled(const Touch& touch);
    void cancel_all();

    std::size_t active_touch_count() const { return targets_.size(); }
    bool is_tracking(TouchId id) const { return targets_.count(id) != 0; }

private:
    struct Tracked {
        std::weak_ptr<Node> target;
        Point last_location;
    };

    std::shared_ptr<Node> root_;
    std::unordered_map<TouchId, Tracked> targets_;
};

} // namespace scene_graph
