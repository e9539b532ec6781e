/// @file status_panel.hpp
/// @brief Side panel listing level state, costume, signal nodes and recent diagnostics.

#pragma once

#include "core/diagnostics.hpp"
#include "game/player_controller.hpp"
#include "timing/tick_evaluator.hpp"

#include <raylib.h>

namespace costumemaster {

/// Draws the status panel showing:
/// - Level name, lifecycle state and whether the exit is satisfied
/// - The worn costume and the unlocked set
/// - Every sender (kind, position, active, timer) and receiver (policy, active)
/// - The most recent diagnostics, coloured by severity
/// @param evaluator The evaluator owning the current level (may have no level)
/// @param player    The player, or nullptr when no level is loaded
/// @param log       Diagnostics raised so far
/// @param panel_x   Left edge of panel in screen coords
/// @param panel_y   Top edge of panel in screen coords
/// @param panel_w   Width of the panel
/// @return Rendered panel height
float draw_status_panel(const TickEvaluator& evaluator, const PlayerController* player,
                        const DiagnosticLog& log, float panel_x, float panel_y, float panel_w);

} // namespace costumemaster
