/// @file main.cpp
/// @brief Costumemaster entry point: plays levels on top of the signal network
///
/// Loads a level file, then each frame samples the keyboard into a stimulus,
/// ticks the evaluator and draws the level with its wiring overlay. Completing
/// a level loads the level it links to; "MainMenu" ends the run.
/// Supports both native desktop and Emscripten/WASM builds.

#include "core/diagnostics.hpp"
#include "game/player_controller.hpp"
#include "rendering/level_renderer.hpp"
#include "rendering/signal_animation.hpp"
#include "rendering/wiring_renderer.hpp"
#include "timing/session.hpp"
#include "timing/tick_evaluator.hpp"
#include "ui/status_panel.hpp"

#include <fmt/format.h>
#include <raylib.h>

#ifdef __EMSCRIPTEN__
#include <emscripten/emscripten.h>
#endif

#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace {

constexpr int INITIAL_WIDTH = 1280;
constexpr int INITIAL_HEIGHT = 720;
constexpr int MIN_WIDTH = 900;
constexpr int MIN_HEIGHT = 500;
constexpr int TARGET_FPS = 60;
constexpr float MAX_TILE_PIXELS = 64.0f;
constexpr float UI_PANEL_WIDTH = 300.0f;
constexpr float UI_MARGIN = 10.0f;
constexpr float LEVEL_PADDING = 40.0f;
constexpr const char* DEFAULT_START_LEVEL = "levels/level1.yaml";

/// All mutable state needed by the frame loop, bundled so it can be passed
/// through Emscripten's void* callback.
struct FrameState {
    costumemaster::SessionContext session;
    costumemaster::DiagnosticLog log;
    costumemaster::TickEvaluator evaluator{session, log};

    std::unique_ptr<costumemaster::PlayerController> player;
    std::unique_ptr<costumemaster::SignalAnimation> anim;
    std::string level_path;
    std::optional<std::string> next_level; ///< Set by the completion callback
    bool show_wiring = true;
    bool finished = false;
};

/// Loads (or reloads) a level file and rebuilds the player and animation state.
void load_level(FrameState& state, const std::string& path) {
    state.player.reset();
    state.anim.reset();
    state.next_level.reset();
    state.level_path = path;

    if (state.evaluator.load_file(path) != costumemaster::LevelState::Ready) {
        return;
    }

    costumemaster::BuiltLevel& level = *state.evaluator.level();
    state.player = std::make_unique<costumemaster::PlayerController>(level);
    state.anim = std::make_unique<costumemaster::SignalAnimation>(&level.network);

    // Loading another level from inside the callback would destroy the
    // evaluator's level mid-dispatch; record the name and load after the tick.
    state.evaluator.set_completion_callback(
        [&state](const std::string& next_level) { state.next_level = next_level; });

    // Stand-in for the audio cues: announce every lever throw and door change on stderr
    for (const auto& sender : level.network.senders()) {
        std::string kind(costumemaster::sender_kind_name(sender->get_kind()));
        state.evaluator.set_sender_hooks(
            sender->get_position(),
            {[kind](costumemaster::GridPosition p) {
                 fmt::print(stderr, "[costumemaster] {} at {} on\n", kind, costumemaster::to_string(p));
             },
             [kind](costumemaster::GridPosition p) {
                 fmt::print(stderr, "[costumemaster] {} at {} off\n", kind, costumemaster::to_string(p));
             }});
    }
}

/// Resolves a linked level name next to the current level file
std::string linked_level_path(const std::string& current_path, const std::string& name) {
    std::filesystem::path dir = std::filesystem::path(current_path).parent_path();
    return (dir / (name + ".yaml")).string();
}

/// Decodes this frame's keyboard state
costumemaster::PlayerInput read_input() {
    costumemaster::PlayerInput input;
    if (IsKeyPressed(KEY_W) || IsKeyPressed(KEY_UP)) {
        input.drow = 1;
    } else if (IsKeyPressed(KEY_S) || IsKeyPressed(KEY_DOWN)) {
        input.drow = -1;
    } else if (IsKeyPressed(KEY_A) || IsKeyPressed(KEY_LEFT)) {
        input.dcol = -1;
    } else if (IsKeyPressed(KEY_D) || IsKeyPressed(KEY_RIGHT)) {
        input.dcol = 1;
    }
    input.use = IsKeyPressed(KEY_E);
    input.next_costume = IsKeyPressed(KEY_F);
    input.previous_costume = IsKeyPressed(KEY_G);
    return input;
}

/// One frame of the application, called each tick by the native loop or by
/// emscripten_set_main_loop_arg.
void frame_tick(FrameState& state) {
    using costumemaster::LevelState;
    float dt = GetFrameTime();

    int screen_w = GetScreenWidth();
    int screen_h = GetScreenHeight();

    // --- Handle keyboard shortcuts ---
    if (IsKeyPressed(KEY_TAB)) {
        state.show_wiring = !state.show_wiring;
    }
    if (IsKeyPressed(KEY_R) && !state.finished) {
        load_level(state, state.level_path);
    }

    // --- Update simulation ---
    LevelState level_state = state.evaluator.state();
    if (state.player && (level_state == LevelState::Ready || level_state == LevelState::Running)) {
        costumemaster::BuiltLevel& level = *state.evaluator.level();
        costumemaster::StimulusSnapshot snapshot = state.player->apply(read_input(), level.network);
        (void)state.evaluator.tick(snapshot, static_cast<double>(dt));
        state.anim->update(dt);
    }

    // --- Draw ---
    BeginDrawing();
    ClearBackground({25, 25, 30, 255});

    float area_w = static_cast<float>(screen_w) - UI_PANEL_WIDTH - 2.0f * UI_MARGIN;
    const costumemaster::BuiltLevel* level = state.evaluator.level();
    if (level != nullptr && state.player && state.anim) {
        Rectangle area = {LEVEL_PADDING, LEVEL_PADDING, area_w - 2.0f * LEVEL_PADDING,
                          static_cast<float>(screen_h) - 2.0f * LEVEL_PADDING};
        costumemaster::LevelView view = costumemaster::fit_level_view(*level, area, MAX_TILE_PIXELS);
        costumemaster::draw_level(*level, *state.player, *state.anim, view);
        if (state.show_wiring) {
            costumemaster::draw_wiring(*level, *state.anim, view);
        }
    }

    // --- Banner ---
    const char* banner = nullptr;
    Color banner_color = {80, 220, 100, 255};
    if (state.finished) {
        banner = "ALL LEVELS COMPLETE";
    } else if (state.evaluator.state() == LevelState::Aborted) {
        banner = "LEVEL FAILED TO LOAD (R to retry)";
        banner_color = {255, 100, 90, 255};
    } else if (state.evaluator.state() == LevelState::Completed) {
        banner = "LEVEL COMPLETE";
    }
    if (banner != nullptr) {
        int width = MeasureText(banner, 24);
        DrawText(banner, static_cast<int>((area_w - static_cast<float>(width)) / 2.0f), 8, 24,
                 banner_color);
    }

    float panel_x = static_cast<float>(screen_w) - UI_PANEL_WIDTH - UI_MARGIN;
    (void)costumemaster::draw_status_panel(state.evaluator, state.player.get(), state.log, panel_x,
                                           UI_MARGIN, UI_PANEL_WIDTH);

    DrawText("WASD move  E use  F/G costume  Tab wiring  R reload", 10, screen_h - 24, 14,
             {140, 140, 140, 255});

    EndDrawing();

    // --- Level transition (takes effect next frame) ---
    if (state.next_level) {
        std::string name = *state.next_level;
        state.next_level.reset();
        if (name == costumemaster::DEFAULT_NEXT_LEVEL) {
            state.finished = true;
        } else {
            load_level(state, linked_level_path(state.level_path, name));
        }
    }
}

#ifdef __EMSCRIPTEN__
/// Emscripten main loop callback: unwraps the void* to FrameState.
void emscripten_frame(void* arg) {
    auto* state = static_cast<FrameState*>(arg);
    frame_tick(*state);
}
#endif

} // namespace

int main(int argc, char** argv) {
    std::string start_level = DEFAULT_START_LEVEL;
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--start-level") == 0 && i + 1 < argc) {
            start_level = argv[++i];
        } else {
            fmt::print(stderr, "usage: {} [--start-level <level.yaml>]\n", argv[0]);
            return 2;
        }
    }

    // --- Initialize Raylib window ---
    SetConfigFlags(FLAG_WINDOW_RESIZABLE);
    InitWindow(INITIAL_WIDTH, INITIAL_HEIGHT, "Costumemaster");
    SetWindowMinSize(MIN_WIDTH, MIN_HEIGHT);
    SetTargetFPS(TARGET_FPS);

    // --- Create all mutable state ---
    FrameState state;
    load_level(state, start_level);

#ifdef __EMSCRIPTEN__
    // Emscripten takes ownership of the main loop; state is passed via void*.
    emscripten_set_main_loop_arg(emscripten_frame, &state, 0, 1);
#else
    while (!WindowShouldClose()) {
        frame_tick(state);
    }
#endif

    CloseWindow();
    return 0;
}
