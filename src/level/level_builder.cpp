/// @file level_builder.cpp
/// @brief Tile parsing into senders/receivers, requisite linking and load checks

#include "level/level_builder.hpp"

#include "core/load_error.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace costumemaster {

namespace {

struct TileName {
    TileKind kind;
    std::string_view name;
};

constexpr TileName TILE_NAMES[] = {
    {TileKind::Floor, "floor"},
    {TileKind::Wall, "wall"},
    {TileKind::Player, "player"},
    {TileKind::Door, "door"},
    {TileKind::Lever, "lever"},
    {TileKind::ToggleLever, "lever_toggle"},
    {TileKind::TimedLever, "lever_timed"},
    {TileKind::ComputerT1, "computer_t1"},
    {TileKind::ComputerT2, "computer_t2"},
    {TileKind::PressurePlate, "plate"},
    {TileKind::IrisScanner, "iris_scanner"},
    {TileKind::HeavyObject, "heavy_object"},
};

} // namespace

std::string_view tile_kind_name(TileKind kind) {
    for (const TileName& entry : TILE_NAMES) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<TileKind> parse_tile_kind(std::string_view name) {
    for (const TileName& entry : TILE_NAMES) {
        if (entry.name == name) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

std::optional<SenderSpec> sender_spec_for(TileKind kind) {
    switch (kind) {
    case TileKind::Lever:
        return SenderSpec{SenderKind::Lever, {ActivationMethod::OncePermanently}};
    case TileKind::ToggleLever:
        return SenderSpec{SenderKind::Lever, {ActivationMethod::OnToggle}};
    case TileKind::TimedLever:
        return SenderSpec{SenderKind::Lever, {ActivationMethod::OnTimer}, TIMED_LEVER_COOLDOWN};
    case TileKind::ComputerT1:
        return SenderSpec{SenderKind::ComputerT1, {ActivationMethod::OncePermanently}};
    case TileKind::ComputerT2:
        return SenderSpec{SenderKind::ComputerT2, {ActivationMethod::OncePermanently}};
    case TileKind::PressurePlate:
        return SenderSpec{SenderKind::PressurePlate, {ActivationMethod::ByIntervention}};
    case TileKind::IrisScanner:
        return SenderSpec{SenderKind::Trigger,
                          {ActivationMethod::ByIntervention, ActivationMethod::OnTimer},
                          IRIS_SCANNER_COOLDOWN};
    default:
        return std::nullopt;
    }
}

BuiltLevel build_level(const LevelData& data, DiagnosticLog& log, PredicateTuning tuning) {
    if (data.unit <= 0.0f) {
        throw LoadError("Invalid tile size.", "The level's unit must be a positive number of pixels.");
    }

    BuiltLevel level;
    level.name = data.name;
    level.unit = data.unit;
    level.config = parse_level_configuration(data.properties, log);
    level.network.set_unit(data.unit);
    level.objects = data.objects;

    level.costumes = costume_set(level.config.costume_set);
    if (std::find(level.costumes.begin(), level.costumes.end(), level.config.starting_costume) ==
        level.costumes.end()) {
        log.warning("Starting costume unavailable.",
                    std::string(costume_name(level.config.starting_costume)) +
                        " is not in costume set " + std::to_string(level.config.costume_set) +
                        "; starting with " + std::string(costume_name(level.costumes.front())) + ".");
        level.config.starting_costume = level.costumes.front();
    }

    int players = 0;
    for (const TileRecord& tile : data.tiles) {
        if (auto spec = sender_spec_for(tile.kind)) {
            try {
                (void)level.network.add_sender(tile.position, spec->kind, spec->methods,
                                               make_stimulus_predicate(spec->kind, tuning), spec->cooldown);
            } catch (const std::invalid_argument& e) {
                throw LoadError("Duplicate sender.", e.what());
            }
            level.floors.push_back(tile.position);
            continue;
        }

        switch (tile.kind) {
        case TileKind::Wall:
            level.walls.push_back(tile.position);
            break;
        case TileKind::Floor:
            level.floors.push_back(tile.position);
            break;
        case TileKind::Player:
            players++;
            level.player_start = tile.position;
            level.floors.push_back(tile.position);
            break;
        case TileKind::Door:
            (void)level.network.add_receiver(tile.position);
            break;
        case TileKind::HeavyObject:
            level.objects.push_back({tile.position, HEAVY_OBJECT_MASS});
            level.floors.push_back(tile.position);
            break;
        default:
            break;
        }
    }

    if (level.walls.empty() && level.floors.empty()) {
        throw LoadError("The tilemap for this map is missing.",
                        "Check the level file and ensure it defines floor or wall tiles.");
    }
    if (players == 0) {
        throw LoadError("The player for this map is missing.",
                        "Check the level file and ensure the tile map includes a tile for the player.");
    }
    if (players > 1) {
        throw LoadError("Too many players.",
                        "The tile map places " + std::to_string(players) + " players; exactly one is allowed.");
    }
    if (level.network.num_receivers() == 0) {
        throw LoadError("The receivers for this map are missing.",
                        "Check the level file and ensure at least one door exists.");
    }
    if (!level.config.exit_location) {
        throw LoadError("The exit for this map is missing.",
                        "Check that the user data contains an exitAt field.");
    }

    level.exit = level.network.find_receiver(*level.config.exit_location);
    if (level.exit == nullptr) {
        throw LoadError("The exit for this map is missing.",
                        "No door exists at the exit location " + to_string(*level.config.exit_location) + ".");
    }

    level.link_report = link_requisites(level.network, level.config.requisites, log);

    // Doors that require inputs in a level without any sender can never open
    if (level.network.num_senders() == 0) {
        for (const Requisite& requisite : level.config.requisites) {
            if (!requisite.required_inputs.empty()) {
                throw LoadError("The senders for this map are missing.",
                                "The door at " + to_string(requisite.output_location) +
                                    " requires inputs, but the level has no levers, plates or computers.");
            }
        }
    }

    if (level.exit->get_policy() == ActivationPolicy::NoInput) {
        log.warning("Exit is not wired.", "No requisite wires the exit at " +
                                              to_string(level.exit->get_position()) +
                                              ", so this level cannot be completed.");
    }

    return level;
}

} // namespace costumemaster
