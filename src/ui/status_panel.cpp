/// @file status_panel.cpp
/// @brief Implements the status panel

#include "ui/status_panel.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>

namespace costumemaster {

namespace {

constexpr int FONT_TITLE = 20;
constexpr int FONT_NORMAL = 15;
constexpr int FONT_SMALL = 13;
constexpr float PADDING = 10.0f;
constexpr float LINE_GAP = 4.0f;
constexpr size_t MAX_DIAGNOSTICS = 5;

const Color BG_COLOR = {35, 35, 42, 230};
const Color BORDER_COLOR = {70, 70, 85, 255};
const Color TEXT_COLOR = {220, 220, 230, 255};
const Color LABEL_COLOR = {160, 160, 180, 255};
const Color ACTIVE_COLOR = {50, 220, 80, 255};
const Color INACTIVE_COLOR = {150, 150, 170, 255};
const Color STATE_COLOR = {180, 180, 100, 255};
const Color INFO_COLOR = {170, 190, 220, 255};
const Color WARNING_COLOR = {255, 200, 80, 255};
const Color CRITICAL_COLOR = {255, 100, 90, 255};

Color severity_color(Severity severity) {
    switch (severity) {
    case Severity::Info:
        return INFO_COLOR;
    case Severity::Warning:
        return WARNING_COLOR;
    case Severity::Critical:
        return CRITICAL_COLOR;
    }
    return TEXT_COLOR;
}

/// Draws wrapped text and returns consumed height.
float draw_wrapped_text(const std::string& text, float x, float y, float max_width, int font_size,
                        Color color) {
    std::istringstream iss(text);
    std::string word;
    std::string line;
    float cy = y;

    while (iss >> word) {
        std::string candidate = line.empty() ? word : (line + " " + word);
        if (MeasureText(candidate.c_str(), font_size) <= static_cast<int>(max_width)) {
            line = std::move(candidate);
        } else {
            if (!line.empty()) {
                DrawText(line.c_str(), static_cast<int>(x), static_cast<int>(cy), font_size, color);
                cy += static_cast<float>(font_size) + LINE_GAP;
            }
            line = word;
        }
    }

    if (!line.empty()) {
        DrawText(line.c_str(), static_cast<int>(x), static_cast<int>(cy), font_size, color);
        cy += static_cast<float>(font_size) + LINE_GAP;
    }
    return cy - y;
}

/// Cursor that stacks lines down the panel
struct Column {
    float x;
    float y;
    float width;

    void line(const std::string& text, int font_size, Color color) {
        y += draw_wrapped_text(text, x, y, width, font_size, color);
    }
    void gap() { y += LINE_GAP * 2.0f; }
};

} // namespace

float draw_status_panel(const TickEvaluator& evaluator, const PlayerController* player,
                        const DiagnosticLog& log, float panel_x, float panel_y, float panel_w) {
    float panel_h = static_cast<float>(GetScreenHeight()) - panel_y - PADDING;
    DrawRectangleRec({panel_x, panel_y, panel_w, panel_h}, BG_COLOR);
    DrawRectangleLinesEx({panel_x, panel_y, panel_w, panel_h}, 1.0f, BORDER_COLOR);

    Column col{panel_x + PADDING, panel_y + PADDING, panel_w - 2.0f * PADDING};
    const BuiltLevel* level = evaluator.level();

    col.line(level != nullptr ? level->name : "No level", FONT_TITLE, TEXT_COLOR);
    col.line(fmt::format("State: {}", level_state_name(evaluator.state())), FONT_NORMAL, STATE_COLOR);
    if (level != nullptr) {
        col.line(fmt::format("Exit {} ({})", to_string(level->exit->get_position()),
                             evaluator.exit_satisfied() ? "open" : "closed"),
                 FONT_NORMAL, evaluator.exit_satisfied() ? ACTIVE_COLOR : INACTIVE_COLOR);
        col.line(fmt::format("Time: {:.1f}s", evaluator.time()), FONT_SMALL, LABEL_COLOR);
    }

    if (player != nullptr) {
        col.gap();
        std::string unlocked;
        for (Costume costume : player->wardrobe().available()) {
            unlocked += (unlocked.empty() ? "" : ", ") + std::string(costume_name(costume));
        }
        col.line(fmt::format("Costume: {}", costume_name(player->wardrobe().current())), FONT_NORMAL,
                 TEXT_COLOR);
        col.line("Unlocked: " + unlocked, FONT_SMALL, LABEL_COLOR);
    }

    if (level != nullptr) {
        col.gap();
        col.line("Senders", FONT_NORMAL, LABEL_COLOR);
        for (const auto& sender : level->network.senders()) {
            std::string text = fmt::format("{} {}", sender_kind_name(sender->get_kind()),
                                           to_string(sender->get_position()));
            if (sender->timer_pending()) {
                text += fmt::format(" ({:.1f}s)", sender->timer_deadline() - evaluator.time());
            }
            col.line(text, FONT_SMALL, sender->is_active() ? ACTIVE_COLOR : INACTIVE_COLOR);
        }

        col.gap();
        col.line("Receivers", FONT_NORMAL, LABEL_COLOR);
        for (const auto& receiver : level->network.receivers()) {
            col.line(fmt::format("Door {} {} [{}]", to_string(receiver->get_position()),
                                 activation_policy_name(receiver->get_policy()),
                                 receiver->get_inputs().size()),
                     FONT_SMALL, receiver->is_active() ? ACTIVE_COLOR : INACTIVE_COLOR);
        }
    }

    const auto& entries = log.entries();
    if (!entries.empty()) {
        col.gap();
        col.line("Diagnostics", FONT_NORMAL, LABEL_COLOR);
        size_t first = entries.size() > MAX_DIAGNOSTICS ? entries.size() - MAX_DIAGNOSTICS : 0;
        for (size_t i = first; i < entries.size(); i++) {
            const Diagnostic& entry = entries[i];
            col.line(entry.title, FONT_SMALL, severity_color(entry.severity));
            if (entry.severity != Severity::Info) {
                col.line(entry.message, FONT_SMALL, LABEL_COLOR);
            }
        }
    }

    return std::max(panel_h, col.y - panel_y);
}

} // namespace costumemaster
