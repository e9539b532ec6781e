/// @file player_controller.cpp
/// @brief Player movement rules and stimulus sampling

#include "game/player_controller.hpp"

namespace costumemaster {

PlayerController::PlayerController(const BuiltLevel& level)
    : unit_(level.unit), position_(level.player_start),
      wardrobe_(level.costumes, level.config.starting_costume),
      walls_(level.walls.begin(), level.walls.end()),
      floors_(level.floors.begin(), level.floors.end()), objects_(level.objects) {}

StimulusSnapshot PlayerController::apply(const PlayerInput& input, const SignalNetwork& network) {
    if (input.next_costume) {
        (void)wardrobe_.next();
    } else if (input.previous_costume) {
        (void)wardrobe_.previous();
    }
    if (input.dcol != 0 || input.drow != 0) {
        (void)move(input.dcol, input.drow, network);
    }
    return snapshot(input.use);
}

bool PlayerController::move(int dcol, int drow, const SignalNetwork& network) {
    GridPosition target{position_.col + dcol, position_.row + drow};
    if (!passable(target, network)) {
        return false;
    }

    if (ObjectRecord* object = object_at(target)) {
        GridPosition behind{target.col + dcol, target.row + drow};
        if (!free_for_object(behind, network)) {
            return false;
        }
        object->position = behind;
    }

    position_ = target;
    return true;
}

StimulusSnapshot PlayerController::snapshot(bool use_requested) const {
    StimulusSnapshot sample;
    sample.player = PlayerSample{grid_to_world(position_, unit_), wardrobe_.current()};
    sample.use_requested = use_requested;
    sample.objects.reserve(objects_.size());
    for (const ObjectRecord& object : objects_) {
        sample.objects.push_back({grid_to_world(object.position, unit_), object.mass});
    }
    return sample;
}

bool PlayerController::passable(GridPosition tile, const SignalNetwork& network) const {
    if (walls_.count(tile) != 0) {
        return wardrobe_.current() == Costume::Bird;
    }
    return floors_.count(tile) != 0 || is_open_door(tile, network);
}

bool PlayerController::free_for_object(GridPosition tile, const SignalNetwork& network) const {
    if (walls_.count(tile) != 0) {
        return false;
    }
    for (const ObjectRecord& object : objects_) {
        if (object.position == tile) {
            return false;
        }
    }
    return floors_.count(tile) != 0 || is_open_door(tile, network);
}

bool PlayerController::is_open_door(GridPosition tile, const SignalNetwork& network) const {
    for (SignalReceiver* receiver : network.receivers_at(tile)) {
        if (receiver->is_active()) {
            return true;
        }
    }
    return false;
}

ObjectRecord* PlayerController::object_at(GridPosition tile) {
    for (ObjectRecord& object : objects_) {
        if (object.position == tile) {
            return &object;
        }
    }
    return nullptr;
}

} // namespace costumemaster
