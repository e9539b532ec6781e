/// @file test_level_config.cpp
/// @brief Tests for property bag decoding and the requisite key/value format

#include <catch2/catch.hpp>

#include "level/level_config.hpp"

#include <vector>

using namespace costumemaster;

TEST_CASE("Policy keywords", "[config]") {
    CHECK(policy_keyword(ActivationPolicy::NoInput) == "none");
    CHECK(policy_keyword(ActivationPolicy::AnyInput) == "any");
    CHECK(policy_keyword(ActivationPolicy::AllInputs) == "all");
    CHECK(parse_policy_keyword("any") == ActivationPolicy::AnyInput);
    CHECK(parse_policy_keyword("all") == ActivationPolicy::AllInputs);
    CHECK(parse_policy_keyword("none") == ActivationPolicy::NoInput);
    CHECK_FALSE(parse_policy_keyword("ALL").has_value());
}

TEST_CASE("Grid positions parse as col,row", "[config]") {
    CHECK(parse_grid_position("2,3") == GridPosition{2, 3});
    CHECK(parse_grid_position(" 10 , 0 ") == GridPosition{10, 0});
    CHECK(parse_grid_position("-1,4") == GridPosition{-1, 4});
    CHECK_FALSE(parse_grid_position("2;3").has_value());
    CHECK_FALSE(parse_grid_position("2,").has_value());
    CHECK_FALSE(parse_grid_position("a,b").has_value());
    CHECK(to_string(GridPosition{5, 7}) == "5,7");
}

TEST_CASE("Requisite entries", "[config]") {
    DiagnosticLog log(false);

    SECTION("keyword and positions") {
        auto req = parse_requisite("requisite_5_5", "all;2,3;4,1", log);
        REQUIRE(req.has_value());
        CHECK(req->output_location == GridPosition{5, 5});
        CHECK(req->requisite == ActivationPolicy::AllInputs);
        CHECK(req->required_inputs == std::vector<GridPosition>{{2, 3}, {4, 1}});
        CHECK(log.empty());
    }

    SECTION("omitted keyword leaves the policy unspecified") {
        auto req = parse_requisite("requisite_1_2", "3,4", log);
        REQUIRE(req.has_value());
        CHECK_FALSE(req->requisite.has_value());
        CHECK(req->required_inputs == std::vector<GridPosition>{{3, 4}});
    }

    SECTION("unknown keyword warns and stays unspecified") {
        auto req = parse_requisite("requisite_1_2", "most;3,4", log);
        REQUIRE(req.has_value());
        CHECK_FALSE(req->requisite.has_value());
        CHECK(req->required_inputs.size() == 1);
        CHECK(log.count(Severity::Warning) == 1);
    }

    SECTION("malformed inputs are skipped with a warning") {
        auto req = parse_requisite("requisite_1_2", "any; 3,4 ;oops;;5,6", log);
        REQUIRE(req.has_value());
        CHECK(req->required_inputs == std::vector<GridPosition>{{3, 4}, {5, 6}});
        CHECK(log.count(Severity::Warning) == 1);
    }

    SECTION("malformed key") {
        CHECK_FALSE(parse_requisite("requisite_x_2", "any;1,1", log).has_value());
        CHECK_FALSE(parse_requisite("requisite_12", "any;1,1", log).has_value());
        CHECK(log.count(Severity::Warning) == 2);
    }
}

TEST_CASE("Configuration defaults", "[config]") {
    DiagnosticLog log(false);
    LevelConfiguration config = parse_level_configuration({}, log);
    CHECK(config.costume_set == 0);
    CHECK(config.next_level_name == "MainMenu");
    CHECK(config.starting_costume == Costume::FlashDrive);
    CHECK_FALSE(config.exit_location.has_value());
    CHECK(config.requisites.empty());
    CHECK(log.empty());
}

TEST_CASE("Configuration from a full property bag", "[config]") {
    DiagnosticLog log(false);
    PropertyBag bag = {
        {"availableCostumes", "2"},
        {"levelLink", "level7"},
        {"startingCostume", "Bird"},
        {"exitAt", "5,5"},
        {"requisite_5_5", "all;2,3"},
        {"requisite_1_1", "any;0,0"},
        {"unrelated", "ignored"},
    };

    LevelConfiguration config = parse_level_configuration(bag, log);
    CHECK(config.costume_set == 2);
    CHECK(config.next_level_name == "level7");
    CHECK(config.starting_costume == Costume::Bird);
    CHECK(config.exit_location == GridPosition{5, 5});
    REQUIRE(config.requisites.size() == 2);
    // Key order, so always the same
    CHECK(config.requisites[0].output_location == GridPosition{1, 1});
    CHECK(config.requisites[1].output_location == GridPosition{5, 5});
    CHECK(log.empty());
}

TEST_CASE("Requisites follow key order, not numeric order", "[config]") {
    DiagnosticLog log(false);
    PropertyBag bag = {
        {"requisite_2_1", "any;0,0"},
        {"requisite_10_1", "any;0,0"},
        {"requisite_5_1", "all;1,1"},
        {"requisite_05_1", "any;2,2"},
    };

    LevelConfiguration config = parse_level_configuration(bag, log);
    REQUIRE(config.requisites.size() == 4);
    CHECK(config.requisites[0].output_location == GridPosition{5, 1});  // requisite_05_1
    CHECK(config.requisites[0].requisite == ActivationPolicy::AnyInput);
    CHECK(config.requisites[1].output_location == GridPosition{10, 1});
    CHECK(config.requisites[2].output_location == GridPosition{2, 1});
    CHECK(config.requisites[3].output_location == GridPosition{5, 1});  // requisite_5_1 applies last
    CHECK(config.requisites[3].requisite == ActivationPolicy::AllInputs);
}

TEST_CASE("Malformed configuration values fall back with warnings", "[config]") {
    DiagnosticLog log(false);
    PropertyBag bag = {
        {"availableCostumes", "lots"},
        {"startingCostume", "Wizard"},
        {"exitAt", "five"},
        {"levelLink", "  "},
    };

    LevelConfiguration config = parse_level_configuration(bag, log);
    CHECK(config.costume_set == 0);
    CHECK(config.starting_costume == Costume::FlashDrive);
    CHECK_FALSE(config.exit_location.has_value());
    CHECK(config.next_level_name == "MainMenu");
    CHECK(log.count(Severity::Warning) == 3);
}
