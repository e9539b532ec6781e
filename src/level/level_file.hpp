#pragma once

/// @file level_file.hpp
/// @brief Reads LevelData from YAML level files
///
/// A level file carries the level name and tile size, the tile map as an
/// ASCII grid and/or explicit tile records, extra movable objects, and the
/// user-data property bag:
///
///   name: Level1
///   unit: 128
///   grid:                 # last line is row 0
///     - "#####"
///     - "#@.D#"
///     - "#####"
///   legend: { "X": wall } # optional extra grid characters
///   tiles:
///     - { col: 2, row: 1, kind: lever, variant: lever_wallup }
///   objects:
///     - { col: 3, row: 1, mass: 60 }
///   user_data:
///     exitAt: "3,1"
///     requisite_3_1: "all;2,1"

#include "level/level_builder.hpp"

#include <map>
#include <optional>
#include <string>

namespace costumemaster {

/// Default character legend for `grid` rows. A space means "no tile".
[[nodiscard]] const std::map<char, TileKind>& default_grid_legend();

/// Parses a level from YAML text.
/// @throws LoadError on malformed YAML or unknown tile kinds
[[nodiscard]] LevelData parse_level_yaml(const std::string& text);

/// Loads a level file from disk.
/// @throws LoadError if the file cannot be read or parsed
[[nodiscard]] LevelData load_level_file(const std::string& path);

} // namespace costumemaster
