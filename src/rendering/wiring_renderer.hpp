/// @file wiring_renderer.hpp
/// @brief Draws the requisite wiring overlay: one line from every wired sender to its receiver

#pragma once

#include "level/level_builder.hpp"
#include "rendering/level_renderer.hpp"
#include "rendering/signal_animation.hpp"

#include <raylib.h>

namespace costumemaster {

/// Draws wiring lines with animation state.
/// Lines from inactive senders are thin and dim; lines from active senders are
/// thick and bright. Positions a receiver requires under AllInputs get a dot
/// at the receiver end, hollow while the requirement is unmet.
/// @param level The loaded level
/// @param anim  Current fade state
/// @param view  Grid-to-screen mapping
void draw_wiring(const BuiltLevel& level, const SignalAnimation& anim, const LevelView& view);

} // namespace costumemaster
