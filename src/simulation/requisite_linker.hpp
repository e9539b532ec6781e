#pragma once

/// @file requisite_linker.hpp
/// @brief Turns level-authored requisites into sender -> receiver wiring

#include "core/diagnostics.hpp"
#include "simulation/grid_position.hpp"
#include "simulation/signal_network.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace costumemaster {

/// A level-authored rule: the receiver at `output_location` listens to the
/// senders at `required_inputs`, combined with `requisite`.
struct Requisite {
    GridPosition output_location;
    std::vector<GridPosition> required_inputs;
    std::optional<ActivationPolicy> requisite; ///< Unspecified means NoInput
};

/// Counts of what the linker did, mostly for tests and the status panel
struct LinkReport {
    size_t requisites_applied = 0;
    size_t inputs_wired = 0;
    size_t missing_outputs = 0;   ///< Requisites naming a position with no receiver
    size_t duplicate_outputs = 0; ///< Requisites naming a position with several receivers
    size_t dangling_inputs = 0;   ///< Required positions with no sender
};

/// Wires the network from the level's requisites, in order, then recomputes
/// every receiver once so the graph has a valid state before the first tick.
///
/// For each requisite:
///   1. Find the receivers at the output location. None: warn, skip.
///      Several: warn about the duplicate mapping and use the first one.
///   2. Wire every sender whose position is required, in sender creation order.
///      Required positions without a sender are warned about and ignored.
///   3. Assign the requisite's policy (NoInput when unspecified).
///
/// @param network The level network (senders and receivers already created)
/// @param requisites Requisites in declaration order
/// @param log Receives a Warning for each degraded mapping
[[nodiscard]] LinkReport link_requisites(SignalNetwork& network, const std::vector<Requisite>& requisites,
                                         DiagnosticLog& log);

} // namespace costumemaster
