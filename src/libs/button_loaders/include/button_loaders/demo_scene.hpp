#pragma once

#include <button_loaders/scene_desc.hpp>

namespace button_loaders {

// Built-in scene used when no scene file can be loaded.
SceneDesc generate_demo_scene();

} // namespace button_loaders
