#pragma once

/// @file grid_position.hpp
/// @brief Grid coordinates (wiring identity) and world-space points

#include <optional>
#include <string>
#include <string_view>

namespace costumemaster {

/// Integer (column, row) tile coordinate. Row 0 is the bottom row of a level.
///
/// This is the stable identity of every sender and receiver; pixel positions
/// are derived from it and never used as keys.
struct GridPosition {
    int col = 0;
    int row = 0;
};

[[nodiscard]] constexpr bool operator==(GridPosition a, GridPosition b) {
    return a.col == b.col && a.row == b.row;
}

[[nodiscard]] constexpr bool operator!=(GridPosition a, GridPosition b) {
    return !(a == b);
}

/// Column-major ordering, matching the order tiles are parsed in
[[nodiscard]] constexpr bool operator<(GridPosition a, GridPosition b) {
    return a.col != b.col ? a.col < b.col : a.row < b.row;
}

/// Formats a position as "col,row"
[[nodiscard]] std::string to_string(GridPosition position);

/// Parses "col,row" (surrounding whitespace allowed). Returns nullopt on malformed text.
[[nodiscard]] std::optional<GridPosition> parse_grid_position(std::string_view text);

/// A 2D point in world pixels
struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;
};

/// Euclidean distance between two world points
[[nodiscard]] float distance(Vec2 a, Vec2 b);

/// Center of a tile in world pixels for a given tile size
[[nodiscard]] constexpr Vec2 grid_to_world(GridPosition position, float unit) {
    return {static_cast<float>(position.col) * unit + unit / 2.0f,
            static_cast<float>(position.row) * unit + unit / 2.0f};
}

} // namespace costumemaster
