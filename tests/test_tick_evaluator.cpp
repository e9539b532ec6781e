/// @file test_tick_evaluator.cpp
/// @brief Tests for the level lifecycle, tick ordering, hooks and completion

#include <catch2/catch.hpp>

#include "timing/tick_evaluator.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace costumemaster;

namespace {

constexpr float UNIT = 128.0f;

/// Walls along rows 0 and 2; player (1,1), plate (2,1), lever (3,1),
/// exit door (5,1) wired to the lever, side door (6,1) wired to the plate.
LevelData signal_room() {
    LevelData data;
    data.name = "signal_room";
    data.unit = UNIT;
    for (int col = 0; col < 8; col++) {
        data.tiles.push_back({{col, 0}, TileKind::Wall, "wall"});
        data.tiles.push_back({{col, 2}, TileKind::Wall, "wall"});
    }
    data.tiles.push_back({{1, 1}, TileKind::Player, "player"});
    data.tiles.push_back({{2, 1}, TileKind::PressurePlate, "plate"});
    data.tiles.push_back({{3, 1}, TileKind::Lever, "lever"});
    data.tiles.push_back({{4, 1}, TileKind::TimedLever, "lever_timed"});
    data.tiles.push_back({{5, 1}, TileKind::Door, "door"});
    data.tiles.push_back({{6, 1}, TileKind::Door, "door"});
    data.properties = {
        {"startingCostume", "Default"}, {"exitAt", "5,1"}, {"levelLink", "level2"},
        {"requisite_5_1", "all;3,1"},    {"requisite_6_1", "any;2,1;4,1"},
    };
    return data;
}

/// Player standing on a tile, optionally pressing use
StimulusSnapshot player_on(GridPosition p, bool use = false) {
    StimulusSnapshot snapshot;
    snapshot.player = PlayerSample{grid_to_world(p, UNIT), Costume::Default};
    snapshot.use_requested = use;
    return snapshot;
}

/// Player far away and one heavy object `dx` pixels right of the plate
StimulusSnapshot object_near_plate(float dx) {
    StimulusSnapshot snapshot = player_on({1, 1});
    Vec2 plate = grid_to_world({2, 1}, UNIT);
    snapshot.player->position = {-1000.0f, -1000.0f};
    snapshot.objects.push_back({{plate.x + dx, plate.y}, 60.0f});
    return snapshot;
}

} // namespace

TEST_CASE("Lifecycle: Loading -> Ready -> Running -> Completed", "[evaluator]") {
    SessionContext session;
    DiagnosticLog log(false);
    TickEvaluator evaluator(session, log);

    CHECK(evaluator.state() == LevelState::Loading);
    CHECK_THROWS_AS(evaluator.tick(StimulusSnapshot{}, 0.016), std::logic_error);

    REQUIRE(evaluator.load(signal_room()) == LevelState::Ready);
    REQUIRE(evaluator.level() != nullptr);

    std::vector<std::string> completions;
    evaluator.set_completion_callback([&](const std::string& next) { completions.push_back(next); });

    TickReport first = evaluator.tick(player_on({1, 1}), 0.016);
    CHECK(first.state == LevelState::Running);
    CHECK(first.events.empty());
    CHECK_FALSE(first.exit_satisfied);

    // Pull the lever: the exit opens on this tick
    TickReport pulled = evaluator.tick(player_on({3, 1}, true), 0.016);
    CHECK(pulled.exit_satisfied);
    CHECK(pulled.state == LevelState::Running);
    REQUIRE(pulled.events.size() == 2);
    CHECK(pulled.events[0].kind == EventKind::SenderActivated);
    CHECK(pulled.events[0].position == GridPosition{3, 1});
    CHECK(pulled.events[1].kind == EventKind::ReceiverActivated);
    CHECK(pulled.events[1].position == GridPosition{5, 1});
    CHECK(completions.empty());

    // ...and the level completes on the next one
    TickReport done = evaluator.tick(player_on({1, 1}), 0.016);
    CHECK(done.state == LevelState::Completed);
    REQUIRE_FALSE(done.events.empty());
    CHECK(done.events.back().kind == EventKind::LevelCompleted);
    CHECK(completions == std::vector<std::string>{"level2"});
    CHECK(session.levels_completed == 1);
    CHECK(session.last_saved_level == "signal_room");

    CHECK_THROWS_AS(evaluator.tick(player_on({1, 1}), 0.016), std::logic_error);
    CHECK(completions.size() == 1);
}

TEST_CASE("Fatal load errors abort the level", "[evaluator]") {
    SessionContext session;
    DiagnosticLog log(false);
    TickEvaluator evaluator(session, log);

    LevelData data = signal_room();
    data.properties.erase("exitAt");

    CHECK(evaluator.load(data) == LevelState::Aborted);
    CHECK(evaluator.level() == nullptr);
    CHECK(log.has_critical());
    CHECK_THROWS_AS(evaluator.tick(StimulusSnapshot{}, 0.016), std::logic_error);

    SECTION("a missing file aborts as well") {
        log.clear();
        CHECK(evaluator.load_file("/nonexistent/level.yaml") == LevelState::Aborted);
        CHECK(log.has_critical());
    }

    SECTION("a level whose exit needs a sender that does not exist aborts") {
        log.clear();
        LevelData senderless = signal_room();
        for (TileRecord& tile : senderless.tiles) {
            if (sender_spec_for(tile.kind)) {
                tile = {tile.position, TileKind::Floor, "floor"};
            }
        }
        CHECK(evaluator.load(senderless) == LevelState::Aborted);
        CHECK(evaluator.level() == nullptr);
        CHECK(log.count(Severity::Critical) == 1);
    }

    SECTION("a good level can be loaded afterwards") {
        CHECK(evaluator.load(signal_room()) == LevelState::Ready);
    }
}

TEST_CASE("Pressure plate crossing fires exactly one deactivate", "[evaluator]") {
    SessionContext session;
    DiagnosticLog log(false);
    TickEvaluator evaluator(session, log);
    REQUIRE(evaluator.load(signal_room()) == LevelState::Ready);

    int activations = 0;
    int deactivations = 0;
    evaluator.set_sender_hooks({2, 1}, {[&](GridPosition) { activations++; },
                                        [&](GridPosition) { deactivations++; }});

    (void)evaluator.tick(object_near_plate(50.0f), 0.016);
    const SignalSender* plate = evaluator.level()->network.find_sender({2, 1});
    CHECK(plate->is_active());
    CHECK(evaluator.level()->network.find_receiver({6, 1})->is_active());
    CHECK(activations == 1);

    TickReport moved = evaluator.tick(object_near_plate(70.0f), 0.016);
    CHECK_FALSE(plate->is_active());
    CHECK(deactivations == 1);
    CHECK(moved.events.front().kind == EventKind::SenderDeactivated);

    for (int i = 0; i < 5; i++) {
        (void)evaluator.tick(object_near_plate(70.0f), 0.016);
    }
    CHECK(deactivations == 1);
    CHECK(activations == 1);
    CHECK(evaluator.state() == LevelState::Running);
}

TEST_CASE("Timed lever switches itself off after its cooldown", "[evaluator]") {
    SessionContext session;
    DiagnosticLog log(false);
    TickEvaluator evaluator(session, log);
    REQUIRE(evaluator.load(signal_room()) == LevelState::Ready);

    (void)evaluator.tick(player_on({4, 1}, true), 0.5);
    const SignalSender* timed = evaluator.level()->network.find_sender({4, 1});
    const SignalReceiver* side_door = evaluator.level()->network.find_receiver({6, 1});
    CHECK(timed->is_active());
    CHECK(side_door->is_active());

    // 2.5s later it is still on
    for (int i = 0; i < 5; i++) {
        (void)evaluator.tick(player_on({1, 1}), 0.5);
    }
    CHECK(timed->is_active());

    TickReport expired = evaluator.tick(player_on({1, 1}), 0.5);
    CHECK_FALSE(timed->is_active());
    CHECK_FALSE(side_door->is_active());
    REQUIRE(expired.events.size() == 2);
    CHECK(expired.events[0].kind == EventKind::SenderDeactivated);
    CHECK(expired.events[1].kind == EventKind::ReceiverDeactivated);
}

TEST_CASE("Failing hooks do not affect state", "[evaluator]") {
    SessionContext session;
    DiagnosticLog log(false);
    TickEvaluator evaluator(session, log);
    REQUIRE(evaluator.load(signal_room()) == LevelState::Ready);
    log.clear();

    evaluator.set_sender_hooks({3, 1}, {[](GridPosition) { throw std::runtime_error("no audio"); },
                                        nullptr});

    TickReport report = evaluator.tick(player_on({3, 1}, true), 0.016);
    CHECK(evaluator.level()->network.find_sender({3, 1})->is_active());
    CHECK(report.exit_satisfied);
    CHECK(log.count(Severity::Warning) == 1);
    CHECK(log.entries().back().title == "Sender hook failed.");
}

TEST_CASE("Hooks throwing non-standard exceptions are logged and rethrown", "[evaluator]") {
    SessionContext session;
    DiagnosticLog log(false);
    TickEvaluator evaluator(session, log);
    REQUIRE(evaluator.load(signal_room()) == LevelState::Ready);
    log.clear();

    evaluator.set_sender_hooks({3, 1}, {[](GridPosition) { throw 42; }, nullptr});

    CHECK_THROWS_AS(evaluator.tick(player_on({3, 1}, true), 0.016), int);
    CHECK(log.count(Severity::Critical) == 1);
    CHECK(log.entries().back().title == "Sender hook failed.");
}

TEST_CASE("A hook may unload the level mid-tick", "[evaluator]") {
    SessionContext session;
    DiagnosticLog log(false);
    TickEvaluator evaluator(session, log);
    REQUIRE(evaluator.load(signal_room()) == LevelState::Ready);

    const std::string restart_message(64, 'r');
    std::vector<std::string> heard;
    std::vector<std::string> completions;
    evaluator.set_completion_callback([&](const std::string& next) { completions.push_back(next); });

    SECTION("on a sender edge") {
        evaluator.set_sender_hooks({3, 1}, {[&, restart_message](GridPosition) {
                                                evaluator.unload();
                                                heard.push_back(restart_message);
                                            },
                                            nullptr});

        TickReport report = evaluator.tick(player_on({3, 1}, true), 0.016);
        CHECK(heard == std::vector<std::string>{restart_message});
        CHECK(report.events.size() == 2);
        CHECK(evaluator.level() == nullptr);
        CHECK(evaluator.state() == LevelState::Loading);
        CHECK_THROWS_AS(evaluator.tick(player_on({1, 1}), 0.016), std::logic_error);
    }

    SECTION("before the completion event is delivered") {
        (void)evaluator.tick(player_on({3, 1}, true), 0.016);
        REQUIRE(evaluator.exit_satisfied());

        evaluator.set_sender_hooks({2, 1}, {[&, restart_message](GridPosition) {
                                                evaluator.unload();
                                                heard.push_back(restart_message);
                                            },
                                            nullptr});

        // Stepping on the plate queues its edge ahead of the completion
        TickReport done = evaluator.tick(player_on({2, 1}), 0.016);
        CHECK(done.state == LevelState::Completed);
        CHECK(done.events.back().kind == EventKind::LevelCompleted);
        CHECK(heard.size() == 1);
        CHECK(completions.empty());
        CHECK(evaluator.level() == nullptr);
    }
}

TEST_CASE("Hooks only attach to senders", "[evaluator]") {
    SessionContext session;
    DiagnosticLog log(false);
    TickEvaluator evaluator(session, log);
    CHECK_THROWS_AS(evaluator.set_sender_hooks({3, 1}, {}), std::out_of_range);

    REQUIRE(evaluator.load(signal_room()) == LevelState::Ready);
    CHECK_NOTHROW(evaluator.set_sender_hooks({3, 1}, {}));
    CHECK_THROWS_AS(evaluator.set_sender_hooks({5, 1}, {}), std::out_of_range);
}

TEST_CASE("Time only moves forward", "[evaluator]") {
    SessionContext session;
    DiagnosticLog log(false);
    TickEvaluator evaluator(session, log);
    REQUIRE(evaluator.load(signal_room()) == LevelState::Ready);

    CHECK_THROWS_AS(evaluator.tick(StimulusSnapshot{}, -0.1), std::invalid_argument);
    (void)evaluator.tick(StimulusSnapshot{}, 0.25);
    (void)evaluator.tick(StimulusSnapshot{}, 0.25);
    CHECK(evaluator.time() == 0.5);
}

TEST_CASE("A tick without a player is not an error", "[evaluator]") {
    SessionContext session;
    DiagnosticLog log(false);
    TickEvaluator evaluator(session, log);
    REQUIRE(evaluator.load(signal_room()) == LevelState::Ready);
    log.clear();

    StimulusSnapshot nobody;
    nobody.use_requested = true;
    TickReport report = evaluator.tick(nobody, 0.016);
    CHECK(report.events.empty());
    CHECK(log.empty());
}

TEST_CASE("Unloading records the level and discards it", "[evaluator]") {
    SessionContext session;
    DiagnosticLog log(false);
    TickEvaluator evaluator(session, log);
    REQUIRE(evaluator.load(signal_room()) == LevelState::Ready);
    (void)evaluator.tick(player_on({4, 1}, true), 1.0);

    evaluator.unload();
    CHECK(evaluator.level() == nullptr);
    CHECK(evaluator.state() == LevelState::Loading);
    CHECK(evaluator.time() == 0.0);
    CHECK(session.last_saved_level == "signal_room");
    CHECK(session.levels_completed == 0);

    // Reloading starts from a fresh graph
    REQUIRE(evaluator.load(signal_room()) == LevelState::Ready);
    CHECK_FALSE(evaluator.level()->network.find_sender({4, 1})->is_active());
}
