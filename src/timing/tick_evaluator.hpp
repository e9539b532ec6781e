#pragma once

/// @file tick_evaluator.hpp
/// @brief Drives a level through its lifecycle and one evaluation pass per frame.
///
/// Each tick runs every sender (creation order), then every receiver
/// (creation order), then the exit check. State changes are collected into
/// the tick's event queue first; hooks and the completion callback are only
/// called once the whole tick has been computed, so a hook can never change
/// what the network decided.

#include "core/diagnostics.hpp"
#include "level/level_builder.hpp"
#include "simulation/stimulus.hpp"
#include "timing/session.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace costumemaster {

/// Lifecycle of one level instance
enum class LevelState { Loading, Ready, Running, Completed, Aborted };

/// Returns the human-readable name of a level state
[[nodiscard]] constexpr std::string_view level_state_name(LevelState state) {
    switch (state) {
    case LevelState::Loading:
        return "Loading";
    case LevelState::Ready:
        return "Ready";
    case LevelState::Running:
        return "Running";
    case LevelState::Completed:
        return "Completed";
    case LevelState::Aborted:
        return "Aborted";
    }
    return "Unknown";
}

/// What happened
enum class EventKind {
    SenderActivated,
    SenderDeactivated,
    ReceiverActivated,
    ReceiverDeactivated,
    LevelCompleted,
};

/// One entry of a tick's effect queue
struct SignalEvent {
    EventKind kind;
    GridPosition position; ///< Sender or receiver position; the exit for LevelCompleted
};

/// Result of one tick
struct TickReport {
    std::vector<SignalEvent> events; ///< Senders, then receivers, then completion
    LevelState state = LevelState::Loading;
    bool exit_satisfied = false; ///< The exit receiver is active after this tick
};

/// Side-effect callbacks for one sender
struct SenderHooks {
    std::function<void(GridPosition)> on_activate;
    std::function<void(GridPosition)> on_deactivate;
};

/// Called once when the level completes, with the configured next level name
using CompletionCallback = std::function<void(const std::string& next_level)>;

/// Owns the current level and evaluates it frame by frame.
///
/// Usage:
///   1. load() a level: Loading, then Ready or Aborted
///   2. optionally register sender hooks and a completion callback
///   3. call tick() every frame; the first tick enters Running
///   4. Completed is entered on the tick after the exit receiver activates
class TickEvaluator {
  public:
    /// @param session Shared session state, must outlive the evaluator
    /// @param log Destination for load and hook diagnostics, must outlive the evaluator
    TickEvaluator(SessionContext& session, DiagnosticLog& log, PredicateTuning tuning = {});

    /// Builds and links a level. Any previous level is unloaded first.
    /// Load failures are reported as Critical diagnostics and leave the
    /// evaluator Aborted; they are not rethrown.
    /// @return Ready or Aborted
    LevelState load(const LevelData& data);

    /// Reads a level file, then loads it as above
    LevelState load_file(const std::string& path);

    /// Discards the current level, its pending timers and its hooks
    void unload();

    /// Runs one evaluation pass.
    /// @param snapshot Player/object sample for this frame
    /// @param delta_time Seconds since the previous tick
    /// @throws std::logic_error unless the level is Ready or Running
    /// @throws std::invalid_argument if delta_time is negative
    /// Hooks throwing a std::exception are logged as Warnings. Anything else is
    /// logged as Critical and rethrown. A hook may unload() or load(); events
    /// still queued for the replaced level are then dropped.
    TickReport tick(const StimulusSnapshot& snapshot, double delta_time);

    /// Registers hooks for the sender at a position, replacing earlier ones.
    /// @throws std::out_of_range if no level is loaded or no sender is there
    void set_sender_hooks(GridPosition position, SenderHooks hooks);

    void set_completion_callback(CompletionCallback callback) { on_complete_ = std::move(callback); }

    // --- Query ---
    [[nodiscard]] LevelState state() const { return state_; }
    [[nodiscard]] double time() const { return now_; }
    [[nodiscard]] bool exit_satisfied() const;
    [[nodiscard]] const BuiltLevel* level() const { return level_ ? &*level_ : nullptr; }
    [[nodiscard]] BuiltLevel* level() { return level_ ? &*level_ : nullptr; }
    [[nodiscard]] const SessionContext& session() const { return session_; }

  private:
    void dispatch(const std::vector<SignalEvent>& events);
    void run_hook(const std::function<void(GridPosition)>& hook, GridPosition position);

    SessionContext& session_;
    DiagnosticLog& log_;
    PredicateTuning tuning_;

    std::optional<BuiltLevel> level_;
    LevelState state_ = LevelState::Loading;
    double now_ = 0.0;
    bool completion_pending_ = false;
    unsigned generation_ = 0; ///< Bumped by unload(), so dispatch notices a hook replacing the level

    std::map<GridPosition, SenderHooks> hooks_;
    CompletionCallback on_complete_;
};

} // namespace costumemaster
