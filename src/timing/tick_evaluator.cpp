/// @file tick_evaluator.cpp
/// @brief Level lifecycle, the per-frame pass and effect dispatch

#include "timing/tick_evaluator.hpp"

#include "core/load_error.hpp"
#include "level/level_file.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace costumemaster {

TickEvaluator::TickEvaluator(SessionContext& session, DiagnosticLog& log, PredicateTuning tuning)
    : session_(session), log_(log), tuning_(tuning) {}

LevelState TickEvaluator::load(const LevelData& data) {
    unload();
    state_ = LevelState::Loading;

    try {
        level_.emplace(build_level(data, log_, tuning_));
    } catch (const LoadError& e) {
        log_.critical(e.title(), e.what());
        level_.reset();
        state_ = LevelState::Aborted;
        return state_;
    }

    // build_level guarantees exactly one player
    state_ = LevelState::Ready;
    log_.info("Level loaded.", "\"" + level_->name + "\" has " +
                                   std::to_string(level_->network.num_senders()) + " senders and " +
                                   std::to_string(level_->network.num_receivers()) + " receivers.");
    return state_;
}

LevelState TickEvaluator::load_file(const std::string& path) {
    LevelData data;
    try {
        data = load_level_file(path);
    } catch (const LoadError& e) {
        unload();
        log_.critical(e.title(), e.what());
        state_ = LevelState::Aborted;
        return state_;
    }
    return load(data);
}

void TickEvaluator::unload() {
    if (level_ && state_ != LevelState::Completed) {
        session_.last_saved_level = level_->name;
    }
    level_.reset();
    hooks_.clear();
    generation_++;
    now_ = 0.0;
    completion_pending_ = false;
    state_ = LevelState::Loading;
}

TickReport TickEvaluator::tick(const StimulusSnapshot& snapshot, double delta_time) {
    if (state_ != LevelState::Ready && state_ != LevelState::Running) {
        throw std::logic_error(std::string("Cannot tick a level that is ") +
                               std::string(level_state_name(state_)));
    }
    if (delta_time < 0.0) {
        throw std::invalid_argument("delta_time must not be negative");
    }

    state_ = LevelState::Running;
    now_ += delta_time;

    TickReport report;
    NetworkUpdate update = level_->network.propagate(snapshot, now_);

    for (const SenderChange& change : update.sender_changes) {
        EventKind kind = change.transition == Transition::Activated ? EventKind::SenderActivated
                                                                    : EventKind::SenderDeactivated;
        report.events.push_back({kind, change.sender->get_position()});
    }
    for (const ReceiverChange& change : update.receiver_changes) {
        EventKind kind = change.active ? EventKind::ReceiverActivated : EventKind::ReceiverDeactivated;
        report.events.push_back({kind, change.receiver->get_position()});
    }

    // Terminal check
    report.exit_satisfied = exit_satisfied();
    if (completion_pending_) {
        state_ = LevelState::Completed;
        session_.last_saved_level = level_->name;
        session_.levels_completed++;
        report.events.push_back({EventKind::LevelCompleted, level_->exit->get_position()});
    } else if (report.exit_satisfied) {
        completion_pending_ = true;
    }
    report.state = state_;

    dispatch(report.events);
    return report;
}

void TickEvaluator::set_sender_hooks(GridPosition position, SenderHooks hooks) {
    if (!level_ || level_->network.find_sender(position) == nullptr) {
        throw std::out_of_range("No sender at " + to_string(position));
    }
    hooks_[position] = std::move(hooks);
}

bool TickEvaluator::exit_satisfied() const {
    return level_ && level_->exit != nullptr && level_->exit->is_active();
}

void TickEvaluator::dispatch(const std::vector<SignalEvent>& events) {
    // Hooks may unload or reload the level; stop as soon as they do
    const std::string next_level = level_->config.next_level_name;
    const unsigned generation = generation_;

    for (const SignalEvent& event : events) {
        if (generation_ != generation) {
            return;
        }
        switch (event.kind) {
        case EventKind::SenderActivated:
        case EventKind::SenderDeactivated: {
            auto it = hooks_.find(event.position);
            if (it == hooks_.end()) {
                break;
            }
            // Copied so the closure outlives a hooks_.clear() made from inside it
            std::function<void(GridPosition)> hook =
                event.kind == EventKind::SenderActivated ? it->second.on_activate : it->second.on_deactivate;
            run_hook(hook, event.position);
            break;
        }
        case EventKind::LevelCompleted:
            if (on_complete_) {
                CompletionCallback callback = on_complete_;
                try {
                    callback(next_level);
                } catch (const std::exception& e) {
                    log_.warning("Completion callback failed.", e.what());
                }
            }
            break;
        default:
            break;
        }
    }
}

void TickEvaluator::run_hook(const std::function<void(GridPosition)>& hook, GridPosition position) {
    if (!hook) {
        return;
    }
    try {
        hook(position);
    } catch (const std::exception& e) {
        log_.warning("Sender hook failed.", "Hook for the sender at " + to_string(position) +
                                                " threw: " + e.what());
    } catch (...) {
        log_.critical("Sender hook failed.", "Hook for the sender at " + to_string(position) +
                                                 " threw a non-standard exception.");
        throw;
    }
}

} // namespace costumemaster
