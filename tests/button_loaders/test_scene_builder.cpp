/**
 * @file test_scene_builder.cpp
 * @brief Unit tests for building live button scenes from descriptions
 */

#include <gtest/gtest.h>

#include <button_loaders/demo_scene.hpp>
#include <button_loaders/scene_builder.hpp>
#include <scene_graph/log.hpp>
#include <scene_graph/touch_dispatcher.hpp>

#include "utils/test_helpers.hpp"

using button_loaders::ButtonDesc;
using button_loaders::VisualDesc;

namespace {

VisualDesc visual(const char* label) {
    VisualDesc v;
    v.label = label;
    return v;
}

} // namespace

TEST(SceneBuilderTest, BuildButtonShowsInitialAppearance) {
    ButtonDesc desc;
    desc.id = "play";
    desc.x = 5;
    desc.y = 6;
    desc.width = 120;
    desc.height = 30;
    desc.normal = visual("Play");
    desc.highlighted = visual("Play!");

    auto button = button_loaders::build_button(desc);

    EXPECT_EQ(button->name(), "play");
    EXPECT_DOUBLE_EQ(button->position().x, 5);
    EXPECT_DOUBLE_EQ(button->size().width, 120);
    ASSERT_NE(button->displayed_node(), nullptr);
    EXPECT_EQ(button->displayed_node()->label(), "Play");
    EXPECT_EQ(button->displayed_node()->name(), "play/normal");
    EXPECT_DOUBLE_EQ(button->displayed_node()->size().height, 30);
    EXPECT_EQ(button->node_disabled(), nullptr);
}

TEST(SceneBuilderTest, BuildButtonAppliesFlags) {
    ButtonDesc desc;
    desc.id = "toggle";
    desc.enabled = false;
    desc.selected = true;
    desc.auto_toggle_selection = true;
    desc.disabled = visual("Off");
    desc.selected_normal = visual("On");

    auto button = button_loaders::build_button(desc);

    EXPECT_FALSE(button->enabled());
    EXPECT_TRUE(button->selected());
    EXPECT_TRUE(button->auto_toggle_selection());
    ASSERT_NE(button->displayed_node(), nullptr);
    EXPECT_EQ(button->displayed_node()->label(), "Off");
}

TEST(SceneBuilderTest, VisualSizeOverridesButtonSize) {
    ButtonDesc owner;
    owner.width = 100;
    owner.height = 40;
    VisualDesc v;
    v.width = 80.0;
    auto node = button_loaders::build_visual(v, owner);
    EXPECT_DOUBLE_EQ(node->size().width, 80);
    EXPECT_DOUBLE_EQ(node->size().height, 40);
}

TEST(SceneBuilderTest, BuildSceneAttachesAllButtons) {
    auto built = button_loaders::build_scene(button_loaders::generate_demo_scene());

    ASSERT_NE(built.root, nullptr);
    EXPECT_EQ(built.root->children().size(), built.buttons.size());
    ASSERT_NE(built.button("play"), nullptr);
    EXPECT_EQ(built.button("missing"), nullptr);
    for (const auto& [id, button] : built.buttons) {
        EXPECT_EQ(button->parent(), built.root.get()) << id;
        EXPECT_NE(button->displayed_node(), nullptr) << id;
        EXPECT_LE(button_kit_test::attached_appearance_count(*button), 1) << id;
    }
    EXPECT_FALSE(built.button("shop")->enabled());
    scene_graph::set_log_level(spdlog::level::info);
}

TEST(SceneBuilderTest, BuildSceneAppliesLogLevel) {
    button_loaders::SceneDesc desc;
    desc.log_level = "warn";
    button_loaders::build_scene(desc);
    EXPECT_EQ(scene_graph::logger("touch_button")->level(), spdlog::level::warn);
    scene_graph::set_log_level(spdlog::level::info);
}

TEST(SceneBuilderTest, DemoSceneToggleWorksThroughDispatcher) {
    auto built = button_loaders::build_scene(button_loaders::generate_demo_scene());
    auto sound = built.button("sound");
    ASSERT_NE(sound, nullptr);

    scene_graph::TouchDispatcher dispatcher(built.root);
    const auto center = sound->position();
    ASSERT_TRUE(dispatcher.touch_began(button_kit_test::touch_at(center.x, center.y)));
    dispatcher.touch_ended(button_kit_test::touch_at(center.x, center.y));

    EXPECT_TRUE(sound->selected());
    EXPECT_EQ(sound->displayed_node()->label(), "Sound: on");
    scene_graph::set_log_level(spdlog::level::info);
}
