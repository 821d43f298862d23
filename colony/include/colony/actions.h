/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace colony
{
    struct cell
    {
        int x = 0;
        int y = 0;

        bool operator==(const cell&) const = default;
    };

    namespace actions
    {
        struct get_state
        {
        };

        struct build
        {
            std::string building_id;
            cell target;
        };

        struct cancel_build
        {
            cell target;
        };

        struct dig
        {
            cell target;
        };

        struct cancel_dig
        {
            cell target;
        };

        // priority is clamped to [1, 9] when encoded
        struct set_priority
        {
            cell target;
            int priority = 5;
        };

        // speed is clamped to [0, 3] when encoded, 0 pauses
        struct set_speed
        {
            int speed = 1;
        };

        struct deploy_blueprint
        {
            nlohmann::json blueprint = nlohmann::json::object();
        };

        struct get_buildings
        {
        };

        // any action the server understands that has no typed counterpart here
        struct raw_action
        {
            std::string name;
            nlohmann::json payload = nlohmann::json::object();
        };
    }

    using request_action = std::variant<actions::get_state,
        actions::build,
        actions::cancel_build,
        actions::dig,
        actions::cancel_dig,
        actions::set_priority,
        actions::set_speed,
        actions::deploy_blueprint,
        actions::get_buildings,
        actions::raw_action>;

    namespace action_names
    {
        inline constexpr std::string_view state_get = "State.Get";
        inline constexpr std::string_view build = "Global.Build";
        inline constexpr std::string_view cancel_build = "Global.CancelBuild";
        inline constexpr std::string_view dig = "Global.Dig";
        inline constexpr std::string_view cancel_dig = "Global.CancelDig";
        inline constexpr std::string_view set_priority = "Global.SetPriority";
        inline constexpr std::string_view set_speed = "Global.SetSpeed";
        inline constexpr std::string_view blueprint_deploy = "Blueprint.Deploy";
        inline constexpr std::string_view info_get_buildings = "Info.GetBuildings";
    }

    inline constexpr int min_speed = 0;
    inline constexpr int max_speed = 3;
    inline constexpr int min_priority = 1;
    inline constexpr int max_priority = 9;

    int clamp_speed(int speed);
    int clamp_priority(int priority);

    std::string action_name(const request_action& action);

    // The wire payload for an action, with speed and priority clamped
    nlohmann::json action_payload(const request_action& action);

    // Maps a wire name and payload back to a typed action. Unknown names, and known names
    // whose payload lacks the fields the typed action needs, become raw_action.
    request_action parse_action(std::string_view name, const nlohmann::json& payload);
}
