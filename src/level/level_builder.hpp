#pragma once

/// @file level_builder.hpp
/// @brief Builds a wired signal network from static level data

#include "core/diagnostics.hpp"
#include "level/level_config.hpp"
#include "simulation/grid_position.hpp"
#include "simulation/requisite_linker.hpp"
#include "simulation/signal_network.hpp"
#include "simulation/stimulus.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace costumemaster {

/// Kinds of tile a level can be drawn with
enum class TileKind {
    Floor,
    Wall,
    Player,
    Door,
    Lever,
    ToggleLever,
    TimedLever,
    ComputerT1,
    ComputerT2,
    PressurePlate,
    IrisScanner,
    HeavyObject,
};

/// Returns the level-file name of a tile kind
[[nodiscard]] std::string_view tile_kind_name(TileKind kind);

/// Parses a level-file tile kind name
[[nodiscard]] std::optional<TileKind> parse_tile_kind(std::string_view name);

/// One tile of the level's tile map
struct TileRecord {
    GridPosition position;
    TileKind kind = TileKind::Floor;
    std::string variant; ///< Texture variant; carried through for the renderer only
};

/// A movable object placed by the level
struct ObjectRecord {
    GridPosition position;
    float mass = 0.0f;
};

/// Mass given to HeavyObject tiles
constexpr float HEAVY_OBJECT_MASS = 60.0f;
/// Seconds a timed lever stays on
constexpr double TIMED_LEVER_COOLDOWN = 3.0;
/// Seconds an iris scanner stays on
constexpr double IRIS_SCANNER_COOLDOWN = 5.0;

/// Static description of a level, as read from a level file
struct LevelData {
    std::string name;
    float unit = 128.0f;
    std::vector<TileRecord> tiles; ///< In parse order; sender/receiver creation follows it
    std::vector<ObjectRecord> objects;
    PropertyBag properties;
};

/// How a tile kind becomes a sender
struct SenderSpec {
    SenderKind kind;
    ActivationMethods methods;
    double cooldown = 0.0;
};

/// Returns the sender a tile kind creates, or nullopt if it is not a sender
[[nodiscard]] std::optional<SenderSpec> sender_spec_for(TileKind kind);

/// A fully built, wired level ready for the tick evaluator
struct BuiltLevel {
    std::string name;
    float unit = 128.0f;
    LevelConfiguration config;
    std::vector<Costume> costumes; ///< Costumes unlocked by the configuration
    SignalNetwork network;
    SignalReceiver* exit = nullptr; ///< Owned by network
    GridPosition player_start;
    std::vector<GridPosition> walls;
    std::vector<GridPosition> floors; ///< Walkable tiles, including those under objects
    std::vector<ObjectRecord> objects;
    LinkReport link_report;
};

/// Builds and links a level.
///
/// Senders and receivers are created in tile order, then the configuration's
/// requisites are linked. Degraded wiring is reported to `log` as warnings.
///
/// @throws LoadError when the level cannot run: no player or several players,
///         no geometry, no receiver, no exit receiver, or two senders on one tile
[[nodiscard]] BuiltLevel build_level(const LevelData& data, DiagnosticLog& log,
                                     PredicateTuning tuning = {});

} // namespace costumemaster
