/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gtest/gtest.h>

#include <colony/colony_state.h>

using colony::colony_state;

namespace
{
    nlohmann::json sample_state()
    {
        return nlohmann::json::parse(R"({
            "timestamp": "2026-03-01T12:00:00Z",
            "world": {"cycle": 42, "timeOfDay": 0.25, "worldSeed": 1234, "asteroidName": "Terra",
                      "temperatureRange": [250.0, 310.5], "pressureRange": [0, 2000]},
            "duplicants": [
                {"id": "d1", "name": "Meep", "position": {"x": 10, "y": 20}, "health": 80,
                 "currentTask": "Dig", "skills": ["Mining1"], "traits": ["Loud"]},
                {"id": "d2", "name": "Ada"},
                {"id": "d3", "name": "Bubbles", "stress": 35.5, "currentTask": null}
            ],
            "buildings": [
                {"id": "b1", "name": "Generator", "position": {"x": 5, "y": 5}, "enabled": true,
                 "health": 100, "storage": {"Coal": 120.0}},
                {"id": "b2", "name": "Ladder"}
            ],
            "resources": [{"name": "Oxygen", "available": 1000, "capacity": 5000, "deltaPerCycle": -12.5}],
            "chores": [{"id": "c1", "name": "Dig", "priority": 7, "assignedTo": "d1", "progress": 0.5}],
            "cells": [{"position": {"x": 1, "y": 1}, "element": "Water", "liquid": true, "mass": 900}],
            "alerts": ["Low oxygen"]
        })");
    }
}

TEST(colony_state_test, decodes_a_full_snapshot)
{
    auto state = sample_state().get<colony_state>();

    EXPECT_EQ(state.timestamp, "2026-03-01T12:00:00Z");
    EXPECT_EQ(state.world.cycle, 42);
    EXPECT_DOUBLE_EQ(state.world.time_of_day, 0.25);
    EXPECT_EQ(state.world.asteroid_name, "Terra");
    EXPECT_DOUBLE_EQ(state.world.temperature_range[1], 310.5);

    ASSERT_EQ(state.duplicants.size(), 3u);
    EXPECT_EQ(state.duplicants[0].name, "Meep");
    EXPECT_DOUBLE_EQ(state.duplicants[0].position.y, 20);
    EXPECT_DOUBLE_EQ(state.duplicants[0].health, 80);
    EXPECT_EQ(state.duplicants[0].current_task, std::optional<std::string>("Dig"));
    EXPECT_EQ(state.duplicants[0].skills, std::vector<std::string>{"Mining1"});
    EXPECT_FALSE(state.duplicants[2].current_task.has_value());
    EXPECT_DOUBLE_EQ(state.duplicants[2].stress, 35.5);

    ASSERT_EQ(state.buildings.size(), 2u);
    EXPECT_TRUE(state.buildings[0].enabled);
    EXPECT_DOUBLE_EQ(state.buildings[0].storage.at("Coal"), 120.0);

    ASSERT_EQ(state.resources.size(), 1u);
    EXPECT_DOUBLE_EQ(state.resources[0].delta_per_cycle, -12.5);
    ASSERT_EQ(state.chores.size(), 1u);
    EXPECT_EQ(state.chores[0].assigned_to, std::optional<std::string>("d1"));
    ASSERT_EQ(state.cells.size(), 1u);
    EXPECT_TRUE(state.cells[0].liquid);
    EXPECT_EQ(state.alerts, std::vector<std::string>{"Low oxygen"});
}

TEST(colony_state_test, absent_fields_keep_defaults)
{
    auto state = sample_state().get<colony_state>();
    const auto& ada = state.duplicants[1];
    EXPECT_DOUBLE_EQ(ada.health, 100);
    EXPECT_DOUBLE_EQ(ada.stress, 0);
    EXPECT_DOUBLE_EQ(ada.calories, 4000);
    EXPECT_DOUBLE_EQ(ada.oxygen, 100);
    EXPECT_DOUBLE_EQ(ada.stamina, 100);
    EXPECT_TRUE(ada.skills.empty());

    const auto& ladder = state.buildings[1];
    EXPECT_FALSE(ladder.enabled);
    EXPECT_DOUBLE_EQ(ladder.max_health, 100);
    EXPECT_TRUE(ladder.storage.empty());

    auto empty = nlohmann::json::object().get<colony_state>();
    EXPECT_TRUE(empty.timestamp.empty());
    EXPECT_EQ(empty.world.cycle, 0);
    EXPECT_TRUE(empty.duplicants.empty());
    EXPECT_TRUE(empty.alerts.empty());
}

TEST(colony_state_test, null_fields_keep_defaults)
{
    auto j = nlohmann::json::parse(R"({
        "timestamp": null,
        "world": {"cycle": null, "asteroidName": null},
        "duplicants": [{"name": "Meep", "health": null, "calories": null, "position": {"x": null, "y": 3}}],
        "buildings": [{"name": "Ladder", "maxHealth": null, "enabled": null, "storage": null}],
        "chores": [{"name": "Dig", "priority": null}]
    })");
    auto state = j.get<colony_state>();
    EXPECT_TRUE(state.timestamp.empty());
    EXPECT_EQ(state.world.cycle, 0);
    EXPECT_TRUE(state.world.asteroid_name.empty());

    ASSERT_EQ(state.duplicants.size(), 1u);
    EXPECT_EQ(state.duplicants[0].name, "Meep");
    EXPECT_DOUBLE_EQ(state.duplicants[0].health, 100);
    EXPECT_DOUBLE_EQ(state.duplicants[0].calories, 4000);
    EXPECT_DOUBLE_EQ(state.duplicants[0].position.x, 0);
    EXPECT_DOUBLE_EQ(state.duplicants[0].position.y, 3);

    ASSERT_EQ(state.buildings.size(), 1u);
    EXPECT_DOUBLE_EQ(state.buildings[0].max_health, 100);
    EXPECT_FALSE(state.buildings[0].enabled);
    EXPECT_TRUE(state.buildings[0].storage.empty());

    ASSERT_EQ(state.chores.size(), 1u);
    EXPECT_EQ(state.chores[0].priority, 0);
}

TEST(colony_state_test, wrong_types_throw)
{
    auto j = sample_state();
    j["duplicants"] = "three";
    EXPECT_THROW(j.get<colony_state>(), nlohmann::json::exception);

    auto k = sample_state();
    k["duplicants"][0]["health"] = "full";
    EXPECT_THROW(k.get<colony_state>(), nlohmann::json::exception);
}

TEST(colony_state_test, encodes_with_wire_names)
{
    auto state = sample_state().get<colony_state>();
    nlohmann::json j = state;
    EXPECT_EQ(j["world"]["timeOfDay"], 0.25);
    EXPECT_EQ(j["resources"][0]["deltaPerCycle"], -12.5);
    EXPECT_EQ(j["buildings"][1]["maxHealth"], 100.0);
    EXPECT_TRUE(j["duplicants"][1]["currentTask"].is_null());
    EXPECT_EQ(j.get<colony_state>().duplicants.size(), 3u);
}
