#include <scene_graph/touch_dispatcher.hpp>
#include <scene_graph/log.hpp>
#include <utility>

namespace scene_graph {

namespace {

std::shared_ptr<Node> hit_node(const std::shared_ptr<Node>& node, Point parent_point) {
    const Point local{ parent_point.x - node->position().x, parent_point.y - node->position().y };
    const auto& children = node->children();
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        if (auto hit = hit_node(*it, local)) return hit;
    }
    if (node->user_interaction_enabled() && node->contains_point(parent_point)) return node;
    return nullptr;
}

} // namespace

TouchDispatcher::TouchDispatcher() = default;

TouchDispatcher::TouchDispatcher(std::shared_ptr<Node> root)
    : root_(std::move(root))
{
}

void TouchDispatcher::set_root(std::shared_ptr<Node> root) {
    cancel_all();
    root_ = std::move(root);
}

std::shared_ptr<Node> TouchDispatcher::hit_test(Point scene_point) const {
    if (!root_) return nullptr;
    return hit_node(root_, scene_point);
}

bool TouchDispatcher::touch_began(const Touch& touch) {
    if (is_tracking(touch.id)) {
        logger("scene_graph")->debug("touch_began ignored, id={} already active", touch.id);
        return false;
    }
    auto target = hit_test(touch.location);
    if (!target) return false;

    targets_[touch.id] = Tracked{ target, touch.location };
    logger("scene_graph")->debug("touch_began id={} at ({}, {}) target='{}'",
        touch.id, touch.location.x, touch.location.y, target->name());
    Touch t = touch;
    t.previous_location = touch.location;
    target->touch_began(t);
    return true;
}

void TouchDispatcher::touch_moved(const Touch& touch) {
    auto it = targets_.find(touch.id);
    if (it == targets_.end()) return;
    auto target = it->second.target.lock();
    if (!target) {
        targets_.erase(it);
        return;
    }
    Touch t = touch;
    t.previous_location = it->second.last_location;
    it->second.last_location = touch.location;
    target->touch_moved(t);
}

void TouchDispatcher::touch_ended(const Touch& touch) {
    auto it = targets_.find(touch.id);
    if (it == targets_.end()) return;
    auto target = it->second.target.lock();
    Touch t = touch;
    t.previous_location = it->second.last_location;
    targets_.erase(it);
    if (!target) return;
    logger("scene_graph")->debug("touch_ended id={} at ({}, {}) target='{}'",
        touch.id, touch.location.x, touch.location.y, target->name());
    target->touch_ended(t);
}

void TouchDispatcher::touch_cancelled(const Touch& touch) {
    auto it = targets_.find(touch.id);
    if (it == targets_.end()) return;
    auto target = it->second.target.lock();
    Touch t = touch;
    t.previous_location = it->second.last_location;
    targets_.erase(it);
    if (!target) return;
    logger("scene_graph")->debug("touch_cancelled id={} target='{}'", touch.id, target->name());
    target->touch_cancelled(t);
}

void TouchDispatcher::cancel_all() {
    auto active = std::move(targets_);
    targets_.clear();
    for (auto& [id, tracked] : active) {
        auto target = tracked.target.lock();
        if (!target) continue;
        logger("scene_graph")->debug("touch_cancelled id={} target='{}'", id, target->name());
        target->touch_cancelled(Touch{ id, tracked.last_location, tracked.last_location });
    }
}

} // namespace scene_graph
