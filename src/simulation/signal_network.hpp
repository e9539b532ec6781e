#pragma once

/// @file signal_network.hpp
/// @brief The level signal graph: owns senders and receivers, runs one evaluation pass

#include "simulation/grid_position.hpp"
#include "simulation/signal_receiver.hpp"
#include "simulation/signal_sender.hpp"
#include "simulation/stimulus.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <vector>

namespace costumemaster {

/// A sender whose state changed during an evaluation pass
struct SenderChange {
    SignalSender* sender;
    Transition transition;
};

/// A receiver whose state changed during an evaluation pass
struct ReceiverChange {
    SignalReceiver* receiver;
    bool active;
};

/// Records which senders and receivers changed during one pass, in creation order
struct NetworkUpdate {
    std::vector<SenderChange> sender_changes;
    std::vector<ReceiverChange> receiver_changes;
};

/// A bipartite graph of senders and receivers for one level.
///
/// The network owns every node; receivers refer to senders by grid position
/// and resolve them through find_sender(). Iteration always follows creation
/// order so a pass is fully deterministic:
///   1. every sender evaluates its predicate against the snapshot
///   2. every receiver recomputes from the new sender states
class SignalNetwork {
  public:
    SignalNetwork() = default;

    // Non-copyable, movable
    SignalNetwork(const SignalNetwork&) = delete;
    SignalNetwork& operator=(const SignalNetwork&) = delete;
    SignalNetwork(SignalNetwork&&) = default;
    SignalNetwork& operator=(SignalNetwork&&) = default;

    /// Creates a sender and returns a non-owning pointer.
    /// @throws std::invalid_argument if a sender already occupies the position
    SignalSender* add_sender(GridPosition position, SenderKind kind, ActivationMethods methods,
                             StimulusPredicate predicate, double cooldown = 0.0);

    /// Creates a receiver and returns a non-owning pointer.
    /// Several receivers may share a position; the requisite linker reports it.
    SignalReceiver* add_receiver(GridPosition position);

    /// Returns the sender at a position, or nullptr
    [[nodiscard]] const SignalSender* find_sender(GridPosition position) const;
    [[nodiscard]] SignalSender* find_sender(GridPosition position);

    /// Returns every receiver at a position, in creation order
    [[nodiscard]] std::vector<SignalReceiver*> receivers_at(GridPosition position) const;

    /// Returns the first receiver created at a position, or nullptr
    [[nodiscard]] SignalReceiver* find_receiver(GridPosition position) const;

    /// Tile size used to place senders in world space for the predicates
    void set_unit(float unit) { unit_ = unit; }
    [[nodiscard]] float unit() const { return unit_; }

    /// Evaluates every sender, then recomputes every receiver.
    /// @param snapshot This tick's player/object sample
    /// @param now Simulation time in seconds
    [[nodiscard]] NetworkUpdate propagate(const StimulusSnapshot& snapshot, double now);

    /// Recomputes every receiver without touching senders
    [[nodiscard]] std::vector<ReceiverChange> recompute_receivers();

    /// Checks that every wired position names a sender in this network.
    /// @throws std::runtime_error on a dangling reference
    void validate_wiring() const;

    // --- Accessors ---
    [[nodiscard]] const std::vector<std::unique_ptr<SignalSender>>& senders() const { return senders_; }
    [[nodiscard]] const std::vector<std::unique_ptr<SignalReceiver>>& receivers() const { return receivers_; }
    [[nodiscard]] size_t num_senders() const { return senders_.size(); }
    [[nodiscard]] size_t num_receivers() const { return receivers_.size(); }

  private:
    uint32_t next_sender_id_ = 0;
    uint32_t next_receiver_id_ = 0;
    float unit_ = 128.0f;

    std::vector<std::unique_ptr<SignalSender>> senders_;
    std::vector<std::unique_ptr<SignalReceiver>> receivers_;
    std::map<GridPosition, SignalSender*> sender_index_;
};

} // namespace costumemaster
