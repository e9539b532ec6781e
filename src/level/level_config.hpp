#pragma once

/// @file level_config.hpp
/// @brief Level configuration decoded from the level's user-data property bag
///
/// Recognised keys:
///   availableCostumes     int, costume set id (default 0)
///   levelLink             name of the level that follows (default "MainMenu")
///   startingCostume       Default | Bird | USB | Sorceress (default USB)
///   exitAt                "col,row" of the exit receiver
///   requisite_<col>_<row> "<any|all|none>;col,row;col,row..." wiring for one receiver

#include "core/diagnostics.hpp"
#include "level/costume.hpp"
#include "simulation/grid_position.hpp"
#include "simulation/requisite_linker.hpp"
#include "simulation/signal_receiver.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace costumemaster {

/// Raw key/value user data attached to a level. Ordered, so requisites are
/// always produced in key order ("requisite_10_1" before "requisite_2_1"),
/// whatever order the level file lists them in.
using PropertyBag = std::map<std::string, std::string>;

constexpr std::string_view REQUISITE_KEY_PREFIX = "requisite_";
constexpr char REQUISITE_SEPARATOR = ';';
constexpr std::string_view DEFAULT_NEXT_LEVEL = "MainMenu";

/// Decoded level properties
struct LevelConfiguration {
    int costume_set = 0;
    std::string next_level_name = std::string(DEFAULT_NEXT_LEVEL);
    Costume starting_costume = Costume::FlashDrive;
    std::optional<GridPosition> exit_location;
    std::vector<Requisite> requisites;
};

/// Returns the requisite keyword for a policy: "none", "any" or "all"
[[nodiscard]] constexpr std::string_view policy_keyword(ActivationPolicy policy) {
    switch (policy) {
    case ActivationPolicy::NoInput:
        return "none";
    case ActivationPolicy::AnyInput:
        return "any";
    case ActivationPolicy::AllInputs:
        return "all";
    }
    return "none";
}

/// Parses an exact (lowercase) requisite keyword
[[nodiscard]] std::optional<ActivationPolicy> parse_policy_keyword(std::string_view keyword);

/// Parses one requisite entry.
/// @param key A "requisite_<col>_<row>" key
/// @param value The ';'-separated keyword and position list
/// @param log Receives a Warning for every item that had to be skipped
/// @return nullopt if the key itself is malformed
[[nodiscard]] std::optional<Requisite> parse_requisite(std::string_view key, std::string_view value,
                                                       DiagnosticLog& log);

/// Decodes a property bag, falling back to defaults for missing or malformed values.
[[nodiscard]] LevelConfiguration parse_level_configuration(const PropertyBag& properties,
                                                           DiagnosticLog& log);

} // namespace costumemaster
