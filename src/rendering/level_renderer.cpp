/// @file level_renderer.cpp
/// @brief Draws tiles and signal nodes with animated state coloring

#include "rendering/level_renderer.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace costumemaster {

namespace {

// --- Color palette ---
const Color FLOOR_COLOR = {45, 45, 52, 255};
const Color FLOOR_LINE_COLOR = {55, 55, 64, 255};
const Color WALL_COLOR = {95, 90, 110, 255};
const Color SENDER_INACTIVE_FILL = {80, 80, 80, 255};  // Dark gray
const Color SENDER_ACTIVE_FILL = {30, 180, 60, 255};   // Bright green
const Color RECEIVER_CLOSED_FILL = {140, 60, 55, 255}; // Brick red
const Color RECEIVER_OPEN_FILL = {50, 200, 90, 255};
const Color EXIT_OUTLINE = {255, 210, 90, 255};
const Color TIMER_PULSE = {255, 225, 145, 255};
const Color OBJECT_COLOR = {150, 110, 70, 255};
const Color PLAYER_COLOR = {90, 170, 255, 255};
const Color LABEL_COLOR = {240, 240, 240, 255};

constexpr float TILE_INSET = 0.12f; // Fraction of a tile left blank around nodes
constexpr float OUTLINE_THICKNESS = 3.0f;
constexpr float CORNER_ROUNDNESS = 0.3f;
constexpr int CORNER_SEGMENTS = 4;

/// Linearly interpolate between two colors
Color lerp_color(Color a, Color b, float t) {
    t = std::clamp(t, 0.0f, 1.0f);
    return {static_cast<unsigned char>(a.r + static_cast<int>((b.r - a.r) * t)),
            static_cast<unsigned char>(a.g + static_cast<int>((b.g - a.g) * t)),
            static_cast<unsigned char>(a.b + static_cast<int>((b.b - a.b) * t)),
            static_cast<unsigned char>(a.a + static_cast<int>((b.a - a.a) * t))};
}

Rectangle inset(Rectangle r, float fraction) {
    float dx = r.width * fraction;
    float dy = r.height * fraction;
    return {r.x + dx, r.y + dy, r.width - 2.0f * dx, r.height - 2.0f * dy};
}

/// Short label drawn on a sender tile
const char* sender_label(SenderKind kind) {
    switch (kind) {
    case SenderKind::Lever:
        return "L";
    case SenderKind::ComputerT1:
        return "T1";
    case SenderKind::ComputerT2:
        return "T2";
    case SenderKind::Trigger:
        return "I";
    case SenderKind::PressurePlate:
        return "P";
    }
    return "?";
}

/// Single-letter initial of the worn costume
const char* costume_initial(Costume costume) {
    switch (costume) {
    case Costume::Default:
        return "D";
    case Costume::Bird:
        return "B";
    case Costume::FlashDrive:
        return "U";
    case Costume::Sorceress:
        return "S";
    }
    return "?";
}

void draw_centered_label(const char* text, Rectangle r, int font_size, Color color) {
    int width = MeasureText(text, font_size);
    DrawText(text, static_cast<int>(r.x + (r.width - static_cast<float>(width)) / 2.0f),
             static_cast<int>(r.y + (r.height - static_cast<float>(font_size)) / 2.0f), font_size,
             color);
}

/// Grows the bounds to include a position
void extend(int& cols, int& rows, GridPosition p) {
    cols = std::max(cols, p.col + 1);
    rows = std::max(rows, p.row + 1);
}

} // namespace

LevelView fit_level_view(const BuiltLevel& level, Rectangle area, float max_tile) {
    LevelView view;
    for (GridPosition p : level.walls) {
        extend(view.cols, view.rows, p);
    }
    for (GridPosition p : level.floors) {
        extend(view.cols, view.rows, p);
    }
    for (const auto& receiver : level.network.receivers()) {
        extend(view.cols, view.rows, receiver->get_position());
    }
    if (view.cols == 0 || view.rows == 0) {
        return view;
    }

    float tile_w = area.width / static_cast<float>(view.cols);
    float tile_h = area.height / static_cast<float>(view.rows);
    view.tile = std::max(4.0f, std::min({tile_w, tile_h, max_tile})); // Floor keeps tiles visible

    float grid_w = view.tile * static_cast<float>(view.cols);
    float grid_h = view.tile * static_cast<float>(view.rows);
    view.offset = {area.x + (area.width - grid_w) / 2.0f, area.y + (area.height - grid_h) / 2.0f};
    return view;
}

Rectangle tile_rect(const LevelView& view, GridPosition position) {
    return {view.offset.x + static_cast<float>(position.col) * view.tile,
            view.offset.y + static_cast<float>(view.rows - 1 - position.row) * view.tile, view.tile,
            view.tile};
}

Vector2 tile_center(const LevelView& view, GridPosition position) {
    Rectangle r = tile_rect(view, position);
    return {r.x + r.width / 2.0f, r.y + r.height / 2.0f};
}

void draw_level(const BuiltLevel& level, const PlayerController& player, const SignalAnimation& anim,
                const LevelView& view) {
    int font_size = std::max(10, static_cast<int>(view.tile * 0.35f));

    // --- Geometry ---
    for (GridPosition p : level.floors) {
        Rectangle r = tile_rect(view, p);
        DrawRectangleRec(r, FLOOR_COLOR);
        DrawRectangleLinesEx(r, 1.0f, FLOOR_LINE_COLOR);
    }
    for (GridPosition p : level.walls) {
        DrawRectangleRec(tile_rect(view, p), WALL_COLOR);
    }

    // --- Receivers ---
    for (const auto& receiver : level.network.receivers()) {
        Rectangle r = inset(tile_rect(view, receiver->get_position()), TILE_INSET);
        float glow = anim.receiver_anim(receiver.get()).glow;
        DrawRectangleRec(r, lerp_color(RECEIVER_CLOSED_FILL, RECEIVER_OPEN_FILL, glow));
        if (receiver.get() == level.exit) {
            DrawRectangleLinesEx(r, OUTLINE_THICKNESS, EXIT_OUTLINE);
        }
    }

    // --- Senders ---
    for (const auto& sender : level.network.senders()) {
        Rectangle r = inset(tile_rect(view, sender->get_position()), TILE_INSET * 1.5f);
        const NodeAnim& node = anim.sender_anim(sender.get());
        DrawRectangleRounded(r, CORNER_ROUNDNESS, CORNER_SEGMENTS,
                             lerp_color(SENDER_INACTIVE_FILL, SENDER_ACTIVE_FILL, node.glow));
        if (sender->timer_pending()) {
            // 0.5 + 0.5 * sin(phase) keeps the pulse outline between 0 and full alpha
            float alpha = 0.5f + 0.5f * std::sin(node.pulse_phase);
            DrawRectangleRoundedLines(r, CORNER_ROUNDNESS, CORNER_SEGMENTS, OUTLINE_THICKNESS,
                                      Fade(TIMER_PULSE, alpha));
        }
        draw_centered_label(sender_label(sender->get_kind()), r, font_size, LABEL_COLOR);
    }

    // --- Objects and player ---
    for (const ObjectRecord& object : player.objects()) {
        DrawRectangleRec(inset(tile_rect(view, object.position), TILE_INSET * 2.0f), OBJECT_COLOR);
    }

    Rectangle player_rect = tile_rect(view, player.position());
    Vector2 center = tile_center(view, player.position());
    DrawCircleV(center, view.tile * 0.35f, PLAYER_COLOR);
    draw_centered_label(costume_initial(player.wardrobe().current()), player_rect, font_size,
                        LABEL_COLOR);
}

} // namespace costumemaster
