#pragma once

#include <scene_graph/child_host.hpp>
#include <scene_graph/touch.hpp>
#include <scene_graph/types.hpp>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace scene_graph {

// A retained scene node. Position is in the parent's space and is also the
// node's local origin; the node's rect of `size` is centered on it.
// Children are owned; the parent pointer is not.
class Node : public ChildHost, public std::enable_shared_from_this<Node> {
public:
    enum class Shape { None, Rectangle, Ellipse };

    Node();
    explicit Node(Size size);
    ~Node() override;

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    static std::shared_ptr<Node> create(Size size = {});

    const std::string& name() const { return name_; }
    void set_name(std::string name) { name_ = std::move(name); }

    Point position() const { return position_; }
    void set_position(Point position) { position_ = position; }

    Size size() const { return size_; }
    void set_size(Size size) { size_ = size; }

    Shape shape() const { return shape_; }
    void set_shape(Shape shape) { shape_ = shape; }
    Color color() const { return color_; }
    void set_color(Color color) { color_ = color; }
    const std::string& label() const { return label_; }
    void set_label(std::string label) { label_ = std::move(label); }

    bool user_interaction_enabled() const { return user_interaction_enabled_; }
    void set_user_interaction_enabled(bool enabled) { user_interaction_enabled_ = enabled; }

    Node* parent() const { return parent_; }
    const std::vector<std::shared_ptr<Node>>& children() const { return children_; }
    bool has_child(const Node& child) const;
    std::shared_ptr<Node> child_named(const std::string& name) const;

    void attach_child(std::shared_ptr<Node> child) override;
    void detach_child(Node& child) override;
    bool contains_point(Point point) const override;
    void remove_from_parent();

    // Rect in the parent's space.
    Rect frame() const;

    Point convert_from_scene(Point scene_point) const;
    Point convert_to_scene(Point local_point) const;
    bool contains_scene_point(Point scene_point) const;

    // Called by TouchDispatcher on the node a touch began on.
    virtual void touch_began(const Touch& touch);
    virtual void touch_moved(const Touch& touch);
    virtual void touch_ended(const Touch& touch);
    virtual void touch_cancelled(const Touch& touch);

private:
    std::string name_;
    Point position_;
    Size size_;
    Shape shape_ = Shape::None;
    Color color_;
    std::string label_;
    bool user_interaction_enabled_ = false;
    Node* parent_ = nullptr;
    std::vector<std::shared_ptr<Node>> children_;
};

} // namespace scene_graph
