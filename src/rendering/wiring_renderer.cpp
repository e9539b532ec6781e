/// @file wiring_renderer.cpp
/// @brief Draws sender-to-receiver wiring with fading signal coloring

#include "rendering/wiring_renderer.hpp"

#include <algorithm>
#include <cmath>

namespace costumemaster {

namespace {

const Color WIRE_INACTIVE_COLOR = {90, 90, 100, 160};
const Color WIRE_ACTIVE_COLOR = {50, 220, 80, 230};
const Color REQUIRED_MET_COLOR = {100, 255, 130, 255};
const Color REQUIRED_UNMET_COLOR = {255, 190, 90, 255};
constexpr float WIRE_INACTIVE_THICKNESS = 1.5f;
constexpr float WIRE_ACTIVE_THICKNESS = 3.0f;
constexpr float REQUIRED_DOT_RADIUS = 4.0f;
constexpr float DOT_PULL = 0.3f; ///< How far toward the sender the required dot sits, in tiles

Color lerp_color(Color a, Color b, float t) {
    t = std::clamp(t, 0.0f, 1.0f);
    return {static_cast<unsigned char>(a.r + static_cast<int>((b.r - a.r) * t)),
            static_cast<unsigned char>(a.g + static_cast<int>((b.g - a.g) * t)),
            static_cast<unsigned char>(a.b + static_cast<int>((b.b - a.b) * t)),
            static_cast<unsigned char>(a.a + static_cast<int>((b.a - a.a) * t))};
}

/// Point on the segment `from -> to` that lies `pixels` away from `to`
Vector2 pull_back(Vector2 from, Vector2 to, float pixels) {
    float dx = from.x - to.x;
    float dy = from.y - to.y;
    float length = std::sqrt(dx * dx + dy * dy);
    if (length <= pixels || length == 0.0f) {
        return to;
    }
    return {to.x + dx / length * pixels, to.y + dy / length * pixels};
}

} // namespace

void draw_wiring(const BuiltLevel& level, const SignalAnimation& anim, const LevelView& view) {
    for (const auto& receiver : level.network.receivers()) {
        Vector2 to = tile_center(view, receiver->get_position());
        const auto& required = receiver->get_required();

        for (GridPosition input : receiver->get_inputs()) {
            const SignalSender* sender = level.network.find_sender(input);
            if (sender == nullptr) {
                continue;
            }
            Vector2 from = tile_center(view, input);
            float glow = anim.sender_anim(sender).glow;
            float thickness =
                WIRE_INACTIVE_THICKNESS + (WIRE_ACTIVE_THICKNESS - WIRE_INACTIVE_THICKNESS) * glow;
            DrawLineEx(from, to, thickness, lerp_color(WIRE_INACTIVE_COLOR, WIRE_ACTIVE_COLOR, glow));

            if (receiver->get_policy() == ActivationPolicy::AllInputs &&
                std::find(required.begin(), required.end(), input) != required.end()) {
                Vector2 dot = pull_back(from, to, view.tile * DOT_PULL);
                if (sender->is_active()) {
                    DrawCircleV(dot, REQUIRED_DOT_RADIUS, REQUIRED_MET_COLOR);
                } else {
                    DrawCircleLines(static_cast<int>(dot.x), static_cast<int>(dot.y),
                                    REQUIRED_DOT_RADIUS, REQUIRED_UNMET_COLOR);
                }
            }
        }
    }
}

} // namespace costumemaster
