/// @file level_file.cpp
/// @brief YAML level file parsing with yaml-cpp

#include "level/level_file.hpp"

#include "core/load_error.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace costumemaster {

namespace {

TileKind require_tile_kind(const std::string& name) {
    auto kind = parse_tile_kind(name);
    if (!kind) {
        throw LoadError("Unknown tile.", "\"" + name + "\" is not a known tile kind.");
    }
    return *kind;
}

std::map<char, TileKind> read_legend(const YAML::Node& node) {
    std::map<char, TileKind> legend = default_grid_legend();
    if (!node) {
        return legend;
    }
    if (!node.IsMap()) {
        throw LoadError("Invalid level file.", "legend must map characters to tile kinds.");
    }
    for (const auto& entry : node) {
        auto symbol = entry.first.as<std::string>();
        if (symbol.size() != 1) {
            throw LoadError("Invalid level file.", "legend key \"" + symbol + "\" must be one character.");
        }
        legend[symbol[0]] = require_tile_kind(entry.second.as<std::string>());
    }
    return legend;
}

/// Grid rows are written top to bottom; the last line is row 0.
/// Tiles are emitted column by column, bottom to top within a column.
void read_grid(const YAML::Node& node, const std::map<char, TileKind>& legend, LevelData& level) {
    if (!node) {
        return;
    }
    if (!node.IsSequence()) {
        throw LoadError("Invalid level file.", "grid must be a list of strings.");
    }

    std::vector<std::string> lines;
    size_t width = 0;
    for (const auto& line : node) {
        lines.push_back(line.as<std::string>());
        width = std::max(width, lines.back().size());
    }

    const int rows = static_cast<int>(lines.size());
    for (size_t col = 0; col < width; col++) {
        for (int row = 0; row < rows; row++) {
            const std::string& line = lines[static_cast<size_t>(rows - 1 - row)];
            if (col >= line.size() || line[col] == ' ') {
                continue;
            }
            auto it = legend.find(line[col]);
            if (it == legend.end()) {
                throw LoadError("Unknown tile.", std::string("Grid character '") + line[col] +
                                                     "' has no legend entry.");
            }
            GridPosition position{static_cast<int>(col), row};
            level.tiles.push_back({position, it->second, std::string(tile_kind_name(it->second))});
        }
    }
}

void read_tiles(const YAML::Node& node, LevelData& level) {
    if (!node) {
        return;
    }
    for (const auto& tile : node) {
        TileKind kind = require_tile_kind(tile["kind"].as<std::string>());
        GridPosition position{tile["col"].as<int>(), tile["row"].as<int>()};
        std::string variant = tile["variant"].as<std::string>(std::string(tile_kind_name(kind)));
        level.tiles.push_back({position, kind, std::move(variant)});
    }
}

void read_objects(const YAML::Node& node, LevelData& level) {
    if (!node) {
        return;
    }
    for (const auto& object : node) {
        GridPosition position{object["col"].as<int>(), object["row"].as<int>()};
        float mass = object["mass"] ? object["mass"].as<float>() : HEAVY_OBJECT_MASS;
        level.objects.push_back({position, mass});
    }
}

/// Scalars are stored as-is; sequences are joined with the requisite separator
void read_user_data(const YAML::Node& node, LevelData& level) {
    if (!node) {
        return;
    }
    if (!node.IsMap()) {
        throw LoadError("User Data Missing", "user_data must be a key/value map.");
    }
    for (const auto& entry : node) {
        auto key = entry.first.as<std::string>();
        const YAML::Node& value = entry.second;
        if (value.IsSequence()) {
            std::string joined;
            for (const auto& item : value) {
                if (!joined.empty()) {
                    joined += REQUISITE_SEPARATOR;
                }
                joined += item.as<std::string>();
            }
            level.properties[key] = joined;
        } else if (value.IsScalar()) {
            level.properties[key] = value.as<std::string>();
        } else {
            throw LoadError("Invalid level file.", "user_data \"" + key + "\" must be a value or a list.");
        }
    }
}

LevelData read_level(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw LoadError("Invalid level file.", "The level file must be a YAML map.");
    }

    LevelData level;
    if (root["name"]) {
        level.name = root["name"].as<std::string>();
    }
    if (root["unit"]) {
        level.unit = root["unit"].as<float>();
    }

    read_grid(root["grid"], read_legend(root["legend"]), level);
    read_tiles(root["tiles"], level);
    read_objects(root["objects"], level);
    read_user_data(root["user_data"], level);
    return level;
}

} // namespace

const std::map<char, TileKind>& default_grid_legend() {
    static const std::map<char, TileKind> legend = {
        {'.', TileKind::Floor},       {'#', TileKind::Wall},        {'@', TileKind::Player},
        {'D', TileKind::Door},        {'L', TileKind::Lever},       {'T', TileKind::ToggleLever},
        {'t', TileKind::TimedLever},  {'1', TileKind::ComputerT1},  {'2', TileKind::ComputerT2},
        {'P', TileKind::PressurePlate}, {'I', TileKind::IrisScanner}, {'B', TileKind::HeavyObject},
    };
    return legend;
}

LevelData parse_level_yaml(const std::string& text) {
    try {
        return read_level(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw LoadError("Invalid level file.", e.what());
    }
}

LevelData load_level_file(const std::string& path) {
    try {
        return read_level(YAML::LoadFile(path));
    } catch (const YAML::BadFile&) {
        throw LoadError("Level file missing.", "Could not open " + path + ".");
    } catch (const YAML::Exception& e) {
        throw LoadError("Invalid level file.", path + ": " + e.what());
    }
}

} // namespace costumemaster
