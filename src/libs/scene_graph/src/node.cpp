#include <scene_graph/node.hpp>
#include <algorithm>
#include <cmath>

namespace scene_graph {

Node::Node() = default;

Node::Node(Size size)
    : size_(size)
{
}

Node::~Node() {
    for (auto& c : children_)
        c->parent_ = nullptr;
}

std::shared_ptr<Node> Node::create(Size size) {
    return std::make_shared<Node>(size);
}

bool Node::has_child(const Node& child) const {
    return child.parent_ == this;
}

std::shared_ptr<Node> Node::child_named(const std::string& name) const {
    for (const auto& c : children_) {
        if (c->name() == name) return c;
    }
    return nullptr;
}

void Node::attach_child(std::shared_ptr<Node> child) {
    if (!child || child.get() == this) return;
    if (child->parent_ == this) return;
    if (child->parent_) child->parent_->detach_child(*child);
    child->parent_ = this;
    children_.push_back(std::move(child));
}

void Node::detach_child(Node& child) {
    if (child.parent_ != this) return;
    auto it = std::find_if(children_.begin(), children_.end(),
        [&](const std::shared_ptr<Node>& c) { return c.get() == &child; });
    if (it == children_.end()) return;
    // Keep the child alive until its parent pointer is cleared.
    std::shared_ptr<Node> keep = std::move(*it);
    children_.erase(it);
    keep->parent_ = nullptr;
}

bool Node::contains_point(Point point) const {
    return std::abs(point.x - position_.x) <= size_.width * 0.5 &&
           std::abs(point.y - position_.y) <= size_.height * 0.5;
}

void Node::remove_from_parent() {
    if (parent_) parent_->detach_child(*this);
}

Rect Node::frame() const {
    return Rect{ position_.x - size_.width * 0.5, position_.y - size_.height * 0.5,
                 size_.width, size_.height };
}

Point Node::convert_from_scene(Point scene_point) const {
    Point p = scene_point;
    for (const Node* n = this; n; n = n->parent_) {
        p.x -= n->position_.x;
        p.y -= n->position_.y;
    }
    return p;
}

Point Node::convert_to_scene(Point local_point) const {
    Point p = local_point;
    for (const Node* n = this; n; n = n->parent_) {
        p.x += n->position_.x;
        p.y += n->position_.y;
    }
    return p;
}

bool Node::contains_scene_point(Point scene_point) const {
    Point p = parent_ ? parent_->convert_from_scene(scene_point) : scene_point;
    return contains_point(p);
}

void Node::touch_began(const Touch&) {}
void Node::touch_moved(const Touch&) {}
void Node::touch_ended(const Touch&) {}
void Node::touch_cancelled(const Touch&) {}

} // namespace scene_graph
