/// @file stimulus.cpp
/// @brief Built-in activation predicates for each sender kind

#include "simulation/stimulus.hpp"

namespace costumemaster {

namespace {

bool player_within_reach(const StimulusContext& context) {
    const auto& player = context.snapshot.player;
    if (!player.has_value()) {
        return false;
    }
    return distance(player->position, context.sender_position) < context.unit / 2.0f;
}

bool used_within_reach(const StimulusContext& context) {
    return context.snapshot.use_requested && player_within_reach(context);
}

bool wearing(const StimulusContext& context, Costume costume) {
    return context.snapshot.player.has_value() && context.snapshot.player->costume == costume;
}

} // namespace

StimulusPredicate make_stimulus_predicate(SenderKind kind, PredicateTuning tuning) {
    switch (kind) {
    case SenderKind::Lever:
        return used_within_reach;

    case SenderKind::ComputerT1:
        return [](const StimulusContext& context) {
            return used_within_reach(context) && wearing(context, Costume::Bird);
        };

    case SenderKind::ComputerT2:
        return [](const StimulusContext& context) {
            return used_within_reach(context) && wearing(context, Costume::FlashDrive);
        };

    case SenderKind::Trigger:
        return player_within_reach;

    case SenderKind::PressurePlate:
        return [tuning](const StimulusContext& context) {
            for (const TrackedObject& object : context.snapshot.objects) {
                if (object.mass >= tuning.plate_min_mass &&
                    distance(object.position, context.sender_position) < tuning.plate_radius) {
                    return true;
                }
            }
            const auto& player = context.snapshot.player;
            return player.has_value() &&
                   distance(player->position, context.sender_position) <= tuning.plate_radius;
        };
    }
    return [](const StimulusContext&) { return false; };
}

} // namespace costumemaster
