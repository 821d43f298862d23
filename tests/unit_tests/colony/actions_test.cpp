/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gtest/gtest.h>

#include <colony/actions.h>

using namespace colony;

TEST(actions_test, speed_is_clamped)
{
    EXPECT_EQ(clamp_speed(-1), 0);
    EXPECT_EQ(clamp_speed(0), 0);
    EXPECT_EQ(clamp_speed(2), 2);
    EXPECT_EQ(clamp_speed(9), 3);
    EXPECT_EQ(action_payload(actions::set_speed{-1}), nlohmann::json({{"speed", 0}}));
    EXPECT_EQ(action_payload(actions::set_speed{9}), nlohmann::json({{"speed", 3}}));
}

TEST(actions_test, priority_is_clamped)
{
    EXPECT_EQ(clamp_priority(0), 1);
    EXPECT_EQ(clamp_priority(5), 5);
    EXPECT_EQ(clamp_priority(20), 9);

    auto payload = action_payload(actions::set_priority{{3, 4}, 20});
    EXPECT_EQ(payload["priority"], 9);
    EXPECT_EQ(payload["cell"], nlohmann::json({{"x", 3}, {"y", 4}}));
    EXPECT_EQ(action_payload(actions::set_priority{{3, 4}, 0})["priority"], 1);
}

TEST(actions_test, names_match_the_wire_protocol)
{
    EXPECT_EQ(action_name(actions::get_state{}), "State.Get");
    EXPECT_EQ(action_name(actions::build{"Ladder", {1, 2}}), "Global.Build");
    EXPECT_EQ(action_name(actions::cancel_build{}), "Global.CancelBuild");
    EXPECT_EQ(action_name(actions::dig{}), "Global.Dig");
    EXPECT_EQ(action_name(actions::cancel_dig{}), "Global.CancelDig");
    EXPECT_EQ(action_name(actions::set_priority{}), "Global.SetPriority");
    EXPECT_EQ(action_name(actions::set_speed{}), "Global.SetSpeed");
    EXPECT_EQ(action_name(actions::deploy_blueprint{}), "Blueprint.Deploy");
    EXPECT_EQ(action_name(actions::get_buildings{}), "Info.GetBuildings");
    EXPECT_EQ(action_name(actions::raw_action{"Debug.Spawn", {}}), "Debug.Spawn");
}

TEST(actions_test, build_payload)
{
    auto payload = action_payload(actions::build{"Generator", {5, 5}});
    EXPECT_EQ(payload, nlohmann::json({{"buildingId", "Generator"}, {"cell", {{"x", 5}, {"y", 5}}}}));
    EXPECT_EQ(action_payload(actions::dig{{-2, 7}}), nlohmann::json({{"cell", {{"x", -2}, {"y", 7}}}}));
    EXPECT_EQ(action_payload(actions::get_state{}), nlohmann::json::object());
}

TEST(actions_test, blueprint_passes_through)
{
    nlohmann::json blueprint = {{"name", "base"}, {"buildings", nlohmann::json::array({{{"id", "Tile"}}})}};
    EXPECT_EQ(action_payload(actions::deploy_blueprint{blueprint}), blueprint);
}

TEST(actions_test, parse_recovers_typed_actions)
{
    auto build = parse_action("Global.Build", {{"buildingId", "Ladder"}, {"cell", {{"x", 1}, {"y", 2}}}});
    ASSERT_TRUE(std::holds_alternative<actions::build>(build));
    EXPECT_EQ(std::get<actions::build>(build).building_id, "Ladder");
    EXPECT_EQ(std::get<actions::build>(build).target, (cell{1, 2}));

    auto speed = parse_action("Global.SetSpeed", {{"speed", 2}});
    ASSERT_TRUE(std::holds_alternative<actions::set_speed>(speed));
    EXPECT_EQ(std::get<actions::set_speed>(speed).speed, 2);

    EXPECT_TRUE(std::holds_alternative<actions::get_state>(parse_action("State.Get", nlohmann::json::object())));
}

TEST(actions_test, parse_falls_back_to_raw)
{
    auto unknown = parse_action("Debug.Spawn", {{"what", "Hatch"}});
    ASSERT_TRUE(std::holds_alternative<actions::raw_action>(unknown));
    EXPECT_EQ(std::get<actions::raw_action>(unknown).name, "Debug.Spawn");

    // known name, payload missing its cell
    auto broken = parse_action("Global.Dig", {{"x", 1}});
    ASSERT_TRUE(std::holds_alternative<actions::raw_action>(broken));
    EXPECT_EQ(action_name(broken), "Global.Dig");
    EXPECT_EQ(action_payload(broken), nlohmann::json({{"x", 1}}));
}
