/**
 * @file test_button_state.cpp
 * @brief Unit tests for button appearance selection and update_state
 */

#include <gtest/gtest.h>

#include <touch_button/button.hpp>

#include "utils/test_helpers.hpp"

#include <memory>

using touch_button::Appearance;
using touch_button::Button;
using button_kit_test::CountingButton;
using button_kit_test::attached_appearance_count;
using button_kit_test::make_visual;

// =============================================================================
// Test Fixture
// =============================================================================

class ButtonStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        button = std::make_shared<CountingButton>(scene_graph::Size{ 100, 100 });
        button->set_node_normal(make_visual("normal"));
        button->set_node_highlighted(make_visual("highlighted"));
        button->set_node_disabled(make_visual("disabled"));
        button->set_node_selected_normal(make_visual("selected_normal"));
        button->set_node_selected_highlighted(make_visual("selected_highlighted"));
    }

    std::shared_ptr<CountingButton> button;
};

// =============================================================================
// Defaults and construction
// =============================================================================

TEST(ButtonTest, Defaults) {
    auto button = Button::create(scene_graph::Size{ 80, 30 });
    EXPECT_TRUE(button->enabled());
    EXPECT_FALSE(button->highlighted());
    EXPECT_FALSE(button->selected());
    EXPECT_FALSE(button->auto_toggle_selection());
    EXPECT_TRUE(button->user_interaction_enabled());
    EXPECT_DOUBLE_EQ(button->size().width, 80);
    EXPECT_DOUBLE_EQ(button->size().height, 30);
    EXPECT_EQ(button->displayed_node(), nullptr);
    EXPECT_TRUE(button->children().empty());
}

TEST(ButtonTest, CreateWithNodesShowsInitialAppearance) {
    auto normal = make_visual("normal");
    touch_button::AppearanceNodes nodes;
    nodes.normal = normal;
    nodes.highlighted = make_visual("highlighted");

    auto button = Button::create(scene_graph::Size{ 100, 100 }, nodes);

    EXPECT_EQ(button->displayed_node(), normal.get());
    EXPECT_TRUE(button->has_child(*normal));
    EXPECT_EQ(button->node_highlighted(), nodes.highlighted);
}

// =============================================================================
// Precedence table
// =============================================================================

TEST(ButtonTest, AppearanceForPrecedence) {
    EXPECT_EQ(Button::appearance_for(false, false, false), Appearance::Disabled);
    EXPECT_EQ(Button::appearance_for(false, true, false), Appearance::Disabled);
    EXPECT_EQ(Button::appearance_for(false, false, true), Appearance::Disabled);
    EXPECT_EQ(Button::appearance_for(false, true, true), Appearance::Disabled);
    EXPECT_EQ(Button::appearance_for(true, false, true), Appearance::SelectedNormal);
    EXPECT_EQ(Button::appearance_for(true, true, true), Appearance::SelectedHighlighted);
    EXPECT_EQ(Button::appearance_for(true, true, false), Appearance::Highlighted);
    EXPECT_EQ(Button::appearance_for(true, false, false), Appearance::Normal);
}

TEST_F(ButtonStateTest, UpdateStateAttachesExactlyTheSelectedNode) {
    // Drive every (enabled, highlighted, selected) combination through real input.
    for (bool enabled : { true, false }) {
        for (bool highlighted : { false, true }) {
            for (bool selected : { false, true }) {
                auto b = std::make_shared<CountingButton>(scene_graph::Size{ 100, 100 });
                b->set_node_normal(make_visual("normal"));
                b->set_node_highlighted(make_visual("highlighted"));
                b->set_node_disabled(make_visual("disabled"));
                b->set_node_selected_normal(make_visual("selected_normal"));
                b->set_node_selected_highlighted(make_visual("selected_highlighted"));
                b->update_state();
                b->set_selected(selected);
                if (highlighted) b->touch_began(button_kit_test::touch_at(0, 0));
                b->set_enabled(enabled);

                const Appearance expected = Button::appearance_for(enabled, highlighted, selected);
                SCOPED_TRACE(touch_button::to_string(expected));
                EXPECT_EQ(b->current_appearance(), expected);
                ASSERT_NE(b->displayed_node(), nullptr);
                EXPECT_EQ(b->displayed_node(), b->node(expected).get());
                EXPECT_TRUE(b->has_child(*b->node(expected)));
                EXPECT_EQ(attached_appearance_count(*b), 1);
                EXPECT_EQ(b->children().size(), 1u);
            }
        }
    }
}

TEST_F(ButtonStateTest, InitialUpdateShowsNormal) {
    button->update_state();
    EXPECT_EQ(button->displayed_node(), button->node_normal().get());
    EXPECT_EQ(button->attach_count, 1);
    EXPECT_EQ(button->detach_count, 0);
}

TEST_F(ButtonStateTest, UpdateStateIsIdempotent) {
    button->update_state();
    button->reset_counts();

    button->update_state();
    button->update_state();

    EXPECT_EQ(button->attach_count, 0);
    EXPECT_EQ(button->detach_count, 0);
    EXPECT_EQ(button->children().size(), 1u);
}

TEST_F(ButtonStateTest, SettingSlotsDoesNotUpdate) {
    EXPECT_TRUE(button->children().empty());
    EXPECT_EQ(button->attach_count, 0);

    button->update_state();
    auto replacement = make_visual("normal2");
    button->set_node_normal(replacement);

    EXPECT_FALSE(button->has_child(*replacement));
    EXPECT_EQ(button->displayed_node()->name(), "normal");

    button->update_state();
    EXPECT_EQ(button->displayed_node(), replacement.get());
    EXPECT_EQ(button->children().size(), 1u);
}

TEST_F(ButtonStateTest, ClearingDisplayedSlotDetachesOnUpdate) {
    button->update_state();
    button->set_node_normal(nullptr);
    button->update_state();
    EXPECT_EQ(button->displayed_node(), nullptr);
    EXPECT_TRUE(button->children().empty());
}

TEST_F(ButtonStateTest, SharedNodeAcrossSlotsDoesNotChurn) {
    auto shared = make_visual("shared");
    button->set_node_normal(shared);
    button->set_node_selected_normal(shared);
    button->update_state();
    button->reset_counts();

    button->set_selected(true);

    EXPECT_EQ(button->attach_count, 0);
    EXPECT_EQ(button->detach_count, 0);
    EXPECT_TRUE(button->has_child(*shared));
}

TEST_F(ButtonStateTest, ReattachesNodeRemovedBehindItsBack) {
    button->update_state();
    button->node_normal()->remove_from_parent();

    button->update_state();

    EXPECT_TRUE(button->has_child(*button->node_normal()));
}

// =============================================================================
// Direct flag changes
// =============================================================================

TEST_F(ButtonStateTest, DisablingShowsDisabledImmediately) {
    button->update_state();
    button->set_enabled(false);
    EXPECT_EQ(button->displayed_node(), button->node_disabled().get());
    EXPECT_EQ(attached_appearance_count(*button), 1);

    button->set_enabled(true);
    EXPECT_EQ(button->displayed_node(), button->node_normal().get());
}

TEST_F(ButtonStateTest, DisablingWhileHighlightedShowsDisabled) {
    button->update_state();
    button->touch_began(button_kit_test::touch_at(10, 10));
    ASSERT_TRUE(button->highlighted());
    ASSERT_EQ(button->displayed_node(), button->node_highlighted().get());

    button->set_enabled(false);

    EXPECT_EQ(button->displayed_node(), button->node_disabled().get());
    EXPECT_EQ(attached_appearance_count(*button), 1);
}

TEST_F(ButtonStateTest, DisabledWithoutNodeShowsNothing) {
    button->set_node_disabled(nullptr);
    button->update_state();
    button->set_enabled(false);
    EXPECT_EQ(button->displayed_node(), nullptr);
    EXPECT_TRUE(button->children().empty());
}

TEST_F(ButtonStateTest, SettingSelectedSwapsToSelectedNode) {
    button->update_state();
    button->set_selected(true);
    EXPECT_EQ(button->displayed_node(), button->node_selected_normal().get());
}

TEST_F(ButtonStateTest, SettingSameFlagDoesNothing) {
    button->update_state();
    button->reset_counts();
    button->set_enabled(true);
    button->set_selected(false);
    EXPECT_EQ(button->attach_count, 0);
    EXPECT_EQ(button->detach_count, 0);
}

TEST(ButtonTest, ToStringNamesEveryAppearance) {
    EXPECT_STREQ(touch_button::to_string(Appearance::Normal), "normal");
    EXPECT_STREQ(touch_button::to_string(Appearance::SelectedHighlighted), "selected_highlighted");
}
