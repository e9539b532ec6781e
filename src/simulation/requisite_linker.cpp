/// @file requisite_linker.cpp
/// @brief Requisite linking with duplicate and dangling reference handling

#include "simulation/requisite_linker.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace costumemaster {

namespace {

bool contains(const std::vector<GridPosition>& positions, GridPosition p) {
    return std::find(positions.begin(), positions.end(), p) != positions.end();
}

/// Required positions with repeats removed, first occurrence kept
std::vector<GridPosition> unique_positions(const std::vector<GridPosition>& positions) {
    std::vector<GridPosition> result;
    for (GridPosition p : positions) {
        if (!contains(result, p)) {
            result.push_back(p);
        }
    }
    return result;
}

} // namespace

LinkReport link_requisites(SignalNetwork& network, const std::vector<Requisite>& requisites,
                           DiagnosticLog& log) {
    LinkReport report;

    for (const Requisite& req : requisites) {
        std::vector<SignalReceiver*> outputs = network.receivers_at(req.output_location);
        if (outputs.empty()) {
            report.missing_outputs++;
            log.warning("Missing output.",
                        "The level configuration has a requisite for " + to_string(req.output_location) +
                            ", but no receiver exists there. The requisite was ignored.");
            continue;
        }
        if (outputs.size() > 1) {
            report.duplicate_outputs++;
            log.warning("Duplicate mappings found.",
                        "The level configuration has duplicate mappings for the output at " +
                            to_string(req.output_location) +
                            ". Ensure that the user data file contains the correct mappings.");
        }

        SignalReceiver* output = outputs.front();
        std::vector<GridPosition> required = unique_positions(req.required_inputs);

        for (const auto& sender : network.senders()) {
            if (contains(required, sender->get_position()) && output->add_input(sender->get_position())) {
                report.inputs_wired++;
            }
        }

        for (GridPosition p : required) {
            if (network.find_sender(p) == nullptr) {
                report.dangling_inputs++;
                log.warning("Missing input.", "The requisite for " + to_string(req.output_location) +
                                                  " requires a sender at " + to_string(p) +
                                                  ", but none exists there.");
            }
        }

        output->set_policy(req.requisite.value_or(ActivationPolicy::NoInput), std::move(required));
        report.requisites_applied++;
    }

    network.validate_wiring();
    (void)network.recompute_receivers();
    return report;
}

} // namespace costumemaster
