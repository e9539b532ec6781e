/// @file level_renderer.hpp
/// @brief Draws the level grid, senders, receivers, objects and the player

#pragma once

#include "game/player_controller.hpp"
#include "level/level_builder.hpp"
#include "rendering/signal_animation.hpp"

#include <raylib.h>

namespace costumemaster {

/// Maps grid positions to screen space. Row 0 is drawn at the bottom.
struct LevelView {
    float tile = 32.0f;     ///< Screen pixels per tile
    Vector2 offset = {0, 0}; ///< Screen position of the top-left tile corner
    int cols = 0;
    int rows = 0;
};

/// Fits a level into a screen area, centred, with tiles capped at `max_tile` pixels
[[nodiscard]] LevelView fit_level_view(const BuiltLevel& level, Rectangle area, float max_tile);

/// Screen rectangle covered by a tile
[[nodiscard]] Rectangle tile_rect(const LevelView& view, GridPosition position);

/// Screen position of a tile's centre
[[nodiscard]] Vector2 tile_center(const LevelView& view, GridPosition position);

/// Draws floors, walls, senders (with fade and timer pulse), receivers
/// (open doors fade to green, the exit is outlined), objects and the player.
/// @param level  The loaded level
/// @param player Current player and object positions
/// @param anim   Current fade state
/// @param view   Grid-to-screen mapping
void draw_level(const BuiltLevel& level, const PlayerController& player, const SignalAnimation& anim,
                const LevelView& view);

} // namespace costumemaster
