/// @file test_signal_network.cpp
/// @brief Tests for SignalNetwork: construction, lookup, ordered propagation

#include <catch2/catch.hpp>

#include "simulation/signal_network.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

using namespace costumemaster;

namespace {

/// Predicate that is true while `*flag` is true
StimulusPredicate follow(const bool* flag) {
    return [flag](const StimulusContext&) { return *flag; };
}

} // namespace

TEST_CASE("Senders are unique per position", "[network]") {
    SignalNetwork network;
    (void)network.add_sender({1, 1}, SenderKind::Lever, {ActivationMethod::OncePermanently}, nullptr);
    CHECK_THROWS_AS(network.add_sender({1, 1}, SenderKind::PressurePlate, {}, nullptr),
                    std::invalid_argument);
    CHECK(network.num_senders() == 1);
}

TEST_CASE("Lookup by position", "[network]") {
    SignalNetwork network;
    SignalSender* lever = network.add_sender({2, 3}, SenderKind::Lever, {}, nullptr);
    SignalReceiver* first = network.add_receiver({1, 1});
    SignalReceiver* second = network.add_receiver({1, 1});

    CHECK(network.find_sender({2, 3}) == lever);
    CHECK(network.find_sender({3, 2}) == nullptr);
    CHECK(network.find_receiver({1, 1}) == first);
    CHECK(network.find_receiver({9, 9}) == nullptr);
    CHECK(network.receivers_at({1, 1}) == std::vector<SignalReceiver*>{first, second});
    CHECK(first->get_id() == 0);
    CHECK(second->get_id() == 1);
}

TEST_CASE("propagate evaluates senders then receivers in creation order", "[network]") {
    SignalNetwork network;
    bool a_on = false;
    bool b_on = false;
    SignalSender* b = network.add_sender({5, 0}, SenderKind::Trigger, {}, follow(&b_on));
    SignalSender* a = network.add_sender({1, 0}, SenderKind::Trigger, {}, follow(&a_on));
    SignalReceiver* any = network.add_receiver({3, 3});
    SignalReceiver* all = network.add_receiver({4, 3});
    for (SignalReceiver* r : {any, all}) {
        r->add_input({5, 0});
        r->add_input({1, 0});
    }
    any->set_policy(ActivationPolicy::AnyInput);
    all->set_policy(ActivationPolicy::AllInputs, {{1, 0}, {5, 0}});

    StimulusSnapshot snapshot;

    a_on = true;
    b_on = true;
    NetworkUpdate update = network.propagate(snapshot, 0.0);
    REQUIRE(update.sender_changes.size() == 2);
    CHECK(update.sender_changes[0].sender == b);
    CHECK(update.sender_changes[1].sender == a);
    REQUIRE(update.receiver_changes.size() == 2);
    CHECK(update.receiver_changes[0].receiver == any);
    CHECK(update.receiver_changes[1].receiver == all);
    CHECK(all->is_active());

    b_on = false;
    update = network.propagate(snapshot, 0.1);
    REQUIRE(update.sender_changes.size() == 1);
    CHECK(update.sender_changes[0].transition == Transition::Deactivated);
    REQUIRE(update.receiver_changes.size() == 1);
    CHECK(update.receiver_changes[0].receiver == all);
    CHECK_FALSE(update.receiver_changes[0].active);
    CHECK(any->is_active());

    // No change, no events
    update = network.propagate(snapshot, 0.2);
    CHECK(update.sender_changes.empty());
    CHECK(update.receiver_changes.empty());
}

TEST_CASE("Predicates see the sender's world position", "[network]") {
    SignalNetwork network;
    network.set_unit(100.0f);
    Vec2 seen{};
    float seen_unit = 0.0f;
    (void)network.add_sender({2, 1}, SenderKind::Trigger, {}, [&](const StimulusContext& context) {
        seen = context.sender_position;
        seen_unit = context.unit;
        return false;
    });

    (void)network.propagate(StimulusSnapshot{}, 0.0);
    CHECK(seen.x == 250.0f);
    CHECK(seen.y == 150.0f);
    CHECK(seen_unit == 100.0f);
}

TEST_CASE("validate_wiring rejects dangling positions", "[network]") {
    SignalNetwork network;
    (void)network.add_sender({1, 1}, SenderKind::Lever, {}, nullptr);
    SignalReceiver* door = network.add_receiver({2, 2});
    door->add_input({1, 1});
    CHECK_NOTHROW(network.validate_wiring());

    door->add_input({7, 7});
    CHECK_THROWS_AS(network.validate_wiring(), std::runtime_error);
}

TEST_CASE("Networks move without invalidating nodes", "[network]") {
    SignalNetwork network;
    SignalSender* lever = network.add_sender({1, 1}, SenderKind::Lever, {}, nullptr);
    SignalNetwork moved = std::move(network);
    CHECK(moved.find_sender({1, 1}) == lever);
}
