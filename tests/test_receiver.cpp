/// @file test_receiver.cpp
/// @brief Tests for receiver policies and recompute idempotence

#include <catch2/catch.hpp>

#include "simulation/signal_network.hpp"

using namespace costumemaster;

namespace {

/// Lever with no predicate; tests drive it through step()
SignalSender* add_lever(SignalNetwork& network, GridPosition p) {
    return network.add_sender(p, SenderKind::Lever, {ActivationMethod::ByIntervention}, nullptr);
}

} // namespace

TEST_CASE("evaluate_policy truth table", "[receiver]") {
    CHECK_FALSE(evaluate_policy(ActivationPolicy::NoInput, {true, true}, {true}));

    CHECK(evaluate_policy(ActivationPolicy::AnyInput, {false, true}, {}));
    CHECK_FALSE(evaluate_policy(ActivationPolicy::AnyInput, {false, false}, {}));
    CHECK_FALSE(evaluate_policy(ActivationPolicy::AnyInput, {}, {}));

    CHECK(evaluate_policy(ActivationPolicy::AllInputs, {}, {true, true}));
    CHECK_FALSE(evaluate_policy(ActivationPolicy::AllInputs, {true, true}, {true, false}));
    CHECK_FALSE(evaluate_policy(ActivationPolicy::AllInputs, {true}, {}));
}

TEST_CASE("AnyInput follows any single wired sender", "[receiver]") {
    SignalNetwork network;
    SignalSender* a = add_lever(network, {1, 1});
    SignalSender* b = add_lever(network, {2, 1});
    SignalReceiver* door = network.add_receiver({5, 1});
    door->add_input({1, 1});
    door->add_input({2, 1});
    door->set_policy(ActivationPolicy::AnyInput);

    CHECK_FALSE(door->recompute(network));

    (void)a->step(true, 0.0);
    CHECK(door->recompute(network));

    (void)b->step(true, 0.0);
    (void)a->step(false, 0.0);
    CHECK(door->recompute(network));

    (void)b->step(false, 0.0);
    CHECK_FALSE(door->recompute(network));
}

TEST_CASE("AllInputs({A,B}) needs both", "[receiver]") {
    SignalNetwork network;
    SignalSender* a = add_lever(network, {1, 1});
    SignalSender* b = add_lever(network, {2, 1});
    SignalReceiver* door = network.add_receiver({5, 1});
    door->add_input({1, 1});
    door->add_input({2, 1});
    door->set_policy(ActivationPolicy::AllInputs, {{1, 1}, {2, 1}});

    (void)a->step(true, 0.0);
    CHECK_FALSE(door->recompute(network));

    (void)b->step(true, 0.0);
    CHECK(door->recompute(network));

    (void)a->step(false, 0.0);
    CHECK_FALSE(door->recompute(network));
}

TEST_CASE("AllInputs with an unwired required position stays inactive", "[receiver]") {
    SignalNetwork network;
    SignalSender* a = add_lever(network, {1, 1});
    SignalSender* b = add_lever(network, {2, 1});
    SignalReceiver* door = network.add_receiver({5, 1});
    door->add_input({1, 1});
    door->set_policy(ActivationPolicy::AllInputs, {{1, 1}, {2, 1}});

    (void)a->step(true, 0.0);
    (void)b->step(true, 0.0);
    CHECK_FALSE(door->recompute(network));
}

TEST_CASE("NoInput is always inactive", "[receiver]") {
    SignalNetwork network;
    SignalSender* a = add_lever(network, {1, 1});
    SignalReceiver* door = network.add_receiver({5, 1});
    door->add_input({1, 1});

    (void)a->step(true, 0.0);
    CHECK(door->get_policy() == ActivationPolicy::NoInput);
    CHECK_FALSE(door->recompute(network));
}

TEST_CASE("recompute is idempotent", "[receiver]") {
    SignalNetwork network;
    SignalSender* a = add_lever(network, {1, 1});
    SignalReceiver* door = network.add_receiver({5, 1});
    door->add_input({1, 1});
    door->set_policy(ActivationPolicy::AnyInput);
    (void)a->step(true, 0.0);

    bool first = door->recompute(network);
    bool second = door->recompute(network);
    CHECK(first == second);
    CHECK(door->is_active());

    // A second network-wide recompute reports no further changes
    CHECK(network.recompute_receivers().empty());
    CHECK(network.recompute_receivers().empty());
}

TEST_CASE("Wiring is deduplicated and clearable", "[receiver]") {
    SignalReceiver door(0, {5, 1});
    CHECK(door.add_input({1, 1}));
    CHECK_FALSE(door.add_input({1, 1}));
    CHECK(door.add_input({2, 1}));
    CHECK(door.get_inputs().size() == 2);

    door.set_policy(ActivationPolicy::AllInputs, {{1, 1}});
    door.clear_inputs();
    CHECK(door.get_inputs().empty());
    CHECK(door.get_required().empty());
    CHECK(door.get_policy() == ActivationPolicy::NoInput);
}
