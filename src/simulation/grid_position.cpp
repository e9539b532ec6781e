/// @file grid_position.cpp
/// @brief Grid position parsing and formatting

#include "simulation/grid_position.hpp"

#include <charconv>
#include <cmath>

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

bool parse_int(std::string_view text, int& out) {
    text = trim(text);
    if (text.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

} // namespace

std::string to_string(GridPosition position) {
    return std::to_string(position.col) + "," + std::to_string(position.row);
}

std::optional<GridPosition> parse_grid_position(std::string_view text) {
    auto comma = text.find(',');
    if (comma == std::string_view::npos) {
        return std::nullopt;
    }
    GridPosition position;
    if (!parse_int(text.substr(0, comma), position.col) ||
        !parse_int(text.substr(comma + 1), position.row)) {
        return std::nullopt;
    }
    return position;
}

float distance(Vec2 a, Vec2 b) {
    float dx = b.x - a.x;
    float dy = b.y - a.y;
    return std::sqrt(dx * dx + dy * dy);
}

} // namespace costumemaster
