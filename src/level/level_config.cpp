/// @file level_config.cpp
/// @brief Property bag decoding and requisite parsing

#include "level/level_config.hpp"

#include <charconv>
#include <utility>

namespace costumemaster {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<int> parse_int(std::string_view text) {
    text = trim(text);
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::vector<std::string_view> split(std::string_view text, char separator) {
    std::vector<std::string_view> items;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find(separator, start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view item = trim(text.substr(start, end - start));
        if (!item.empty()) {
            items.push_back(item);
        }
        start = end + 1;
    }
    return items;
}

/// "requisite_<col>_<row>" -> (col, row)
std::optional<GridPosition> parse_requisite_key(std::string_view key) {
    if (key.substr(0, REQUISITE_KEY_PREFIX.size()) != REQUISITE_KEY_PREFIX) {
        return std::nullopt;
    }
    std::string_view coords = key.substr(REQUISITE_KEY_PREFIX.size());
    size_t underscore = coords.find('_');
    if (underscore == std::string_view::npos) {
        return std::nullopt;
    }
    auto col = parse_int(coords.substr(0, underscore));
    auto row = parse_int(coords.substr(underscore + 1));
    if (!col || !row) {
        return std::nullopt;
    }
    return GridPosition{*col, *row};
}

} // namespace

std::optional<ActivationPolicy> parse_policy_keyword(std::string_view keyword) {
    for (ActivationPolicy policy :
         {ActivationPolicy::NoInput, ActivationPolicy::AnyInput, ActivationPolicy::AllInputs}) {
        if (policy_keyword(policy) == keyword) {
            return policy;
        }
    }
    return std::nullopt;
}

std::optional<Requisite> parse_requisite(std::string_view key, std::string_view value,
                                         DiagnosticLog& log) {
    auto output = parse_requisite_key(key);
    if (!output) {
        log.warning("Malformed requisite.",
                    "The user data key \"" + std::string(key) + "\" is not of the form requisite_COL_ROW.");
        return std::nullopt;
    }

    Requisite requisite;
    requisite.output_location = *output;

    std::vector<std::string_view> items = split(value, REQUISITE_SEPARATOR);
    size_t first_position = 0;
    if (!items.empty() && !parse_grid_position(items.front())) {
        first_position = 1;
        requisite.requisite = parse_policy_keyword(items.front());
        if (!requisite.requisite) {
            log.warning("Unknown requisite keyword.",
                        "\"" + std::string(items.front()) + "\" in " + std::string(key) +
                            " is not one of any, all, none. The requisite defaults to none.");
        }
    }

    for (size_t i = first_position; i < items.size(); i++) {
        if (auto position = parse_grid_position(items[i])) {
            requisite.required_inputs.push_back(*position);
        } else {
            log.warning("Malformed requisite input.", "\"" + std::string(items[i]) + "\" in " +
                                                          std::string(key) + " is not a col,row position.");
        }
    }
    return requisite;
}

LevelConfiguration parse_level_configuration(const PropertyBag& properties, DiagnosticLog& log) {
    LevelConfiguration config;

    if (auto it = properties.find("availableCostumes"); it != properties.end()) {
        if (auto id = parse_int(it->second)) {
            config.costume_set = *id;
        } else {
            log.warning("Invalid costume set.",
                        "availableCostumes \"" + it->second + "\" is not a number. Using 0.");
        }
    }

    if (auto it = properties.find("levelLink"); it != properties.end() && !trim(it->second).empty()) {
        config.next_level_name = std::string(trim(it->second));
    }

    if (auto it = properties.find("startingCostume"); it != properties.end()) {
        if (auto costume = parse_costume(trim(it->second))) {
            config.starting_costume = *costume;
        } else {
            log.warning("Unknown costume.",
                        "startingCostume \"" + it->second + "\" is not a known costume. Using USB.");
        }
    }

    if (auto it = properties.find("exitAt"); it != properties.end()) {
        config.exit_location = parse_grid_position(it->second);
        if (!config.exit_location) {
            log.warning("Invalid exit location.", "exitAt \"" + it->second + "\" is not a col,row position.");
        }
    }

    for (const auto& [key, value] : properties) {
        if (key.compare(0, REQUISITE_KEY_PREFIX.size(), REQUISITE_KEY_PREFIX) != 0) {
            continue;
        }
        if (auto requisite = parse_requisite(key, value, log)) {
            config.requisites.push_back(std::move(*requisite));
        }
    }

    return config;
}

} // namespace costumemaster
