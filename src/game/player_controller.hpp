#pragma once

/// @file player_controller.hpp
/// @brief Tile-by-tile player movement, object pushing and the per-tick stimulus sample

#include "level/costume.hpp"
#include "level/level_builder.hpp"
#include "simulation/grid_position.hpp"
#include "simulation/signal_network.hpp"
#include "simulation/stimulus.hpp"

#include <set>
#include <vector>

namespace costumemaster {

/// One frame of player intent, already decoded from the keyboard
struct PlayerInput {
    int dcol = 0; ///< -1, 0 or 1
    int drow = 0; ///< -1, 0 or 1; positive is up
    bool use = false;
    bool next_costume = false;
    bool previous_costume = false;
};

/// Moves the player around a built level.
///
/// Walkable tiles are floors and open doors. Walls block unless the player
/// wears the Bird costume. Walking into a movable object pushes it one tile
/// if the tile behind it is free floor.
class PlayerController {
  public:
    /// Places the player on the level's start tile wearing the configured costume
    explicit PlayerController(const BuiltLevel& level);

    /// Applies one frame of input: costume change first, then movement.
    /// @return The stimulus sample for this frame's tick
    StimulusSnapshot apply(const PlayerInput& input, const SignalNetwork& network);

    /// Attempts a one-tile step. Returns true if the player moved.
    bool move(int dcol, int drow, const SignalNetwork& network);

    /// Builds the sample the senders see this tick
    [[nodiscard]] StimulusSnapshot snapshot(bool use_requested) const;

    [[nodiscard]] GridPosition position() const { return position_; }
    [[nodiscard]] const Wardrobe& wardrobe() const { return wardrobe_; }
    [[nodiscard]] Wardrobe& wardrobe() { return wardrobe_; }
    [[nodiscard]] const std::vector<ObjectRecord>& objects() const { return objects_; }

  private:
    /// Whether a tile can be entered by the player
    [[nodiscard]] bool passable(GridPosition tile, const SignalNetwork& network) const;
    /// Whether an object can be pushed onto a tile
    [[nodiscard]] bool free_for_object(GridPosition tile, const SignalNetwork& network) const;
    [[nodiscard]] bool is_open_door(GridPosition tile, const SignalNetwork& network) const;
    [[nodiscard]] ObjectRecord* object_at(GridPosition tile);

    float unit_;
    GridPosition position_;
    Wardrobe wardrobe_;
    std::set<GridPosition> walls_;
    std::set<GridPosition> floors_;
    std::vector<ObjectRecord> objects_;
};

} // namespace costumemaster
