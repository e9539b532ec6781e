#pragma once

/// @file stimulus.hpp
/// @brief Per-tick player/object sampling and the injected activation predicates
///
/// The core never looks at the scene directly. Each frame the game samples
/// the player and the dynamic objects into a StimulusSnapshot; every sender
/// then asks its own StimulusPredicate whether that snapshot activates it.
/// Predicates are plain callables chosen by sender kind at construction, so
/// new kinds of sender only need a new predicate.

#include "level/costume.hpp"
#include "simulation/grid_position.hpp"

#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace costumemaster {

/// Kinds of signal sender. Only used to pick the activation predicate.
enum class SenderKind { Lever, ComputerT1, ComputerT2, Trigger, PressurePlate };

/// Returns the human-readable name of a sender kind
[[nodiscard]] constexpr std::string_view sender_kind_name(SenderKind kind) {
    switch (kind) {
    case SenderKind::Lever:
        return "Lever";
    case SenderKind::ComputerT1:
        return "ComputerT1";
    case SenderKind::ComputerT2:
        return "ComputerT2";
    case SenderKind::Trigger:
        return "Trigger";
    case SenderKind::PressurePlate:
        return "PressurePlate";
    }
    return "Unknown";
}

/// The player as seen by the signal network for one tick
struct PlayerSample {
    Vec2 position;
    Costume costume = Costume::FlashDrive;
};

/// A movable object that can weigh down a pressure plate
struct TrackedObject {
    Vec2 position;
    float mass = 0.0f;
};

/// Everything the senders may react to during one tick.
/// A missing player is not an error: player-based predicates read as false.
struct StimulusSnapshot {
    std::optional<PlayerSample> player;
    bool use_requested = false; ///< The player pressed "use" this tick
    std::vector<TrackedObject> objects;
};

/// What a predicate gets to look at: the snapshot plus where the sender is
struct StimulusContext {
    const StimulusSnapshot& snapshot;
    Vec2 sender_position; ///< World pixels
    float unit;           ///< Tile size in world pixels
};

/// Decides whether a sender is stimulated this tick
using StimulusPredicate = std::function<bool(const StimulusContext&)>;

/// Distances and weights used by the built-in predicates
struct PredicateTuning {
    float plate_radius = 64.0f;     ///< Pressure plate reach, world pixels
    float plate_min_mass = 50.0f;   ///< Lightest object that presses a plate
};

/// Returns the predicate for a sender kind:
/// - PressurePlate: a heavy enough object strictly inside the radius, or the
///   player within the radius
/// - Lever: a use request with the player closer than half a tile
/// - ComputerT1 / ComputerT2: as Lever, wearing the Bird / USB costume
/// - Trigger: the player closer than half a tile
[[nodiscard]] StimulusPredicate make_stimulus_predicate(SenderKind kind,
                                                        PredicateTuning tuning = {});

} // namespace costumemaster
