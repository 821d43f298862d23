/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>

#include <colony/actions.h>
#include <colony/logging.h>

namespace colony
{
    namespace
    {
        template<class... Ts> struct overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

        nlohmann::json cell_json(const cell& target)
        {
            return {{"x", target.x}, {"y", target.y}};
        }

        // throws nlohmann::json::exception when the cell is missing or not integral
        cell read_cell(const nlohmann::json& payload)
        {
            const auto& value = payload.at("cell");
            return cell{value.at("x").get<int>(), value.at("y").get<int>()};
        }
    }

    int clamp_speed(int speed)
    {
        return std::clamp(speed, min_speed, max_speed);
    }

    int clamp_priority(int priority)
    {
        return std::clamp(priority, min_priority, max_priority);
    }

    std::string action_name(const request_action& action)
    {
        return std::visit(overloaded{
                              [](const actions::get_state&) { return std::string(action_names::state_get); },
                              [](const actions::build&) { return std::string(action_names::build); },
                              [](const actions::cancel_build&) { return std::string(action_names::cancel_build); },
                              [](const actions::dig&) { return std::string(action_names::dig); },
                              [](const actions::cancel_dig&) { return std::string(action_names::cancel_dig); },
                              [](const actions::set_priority&) { return std::string(action_names::set_priority); },
                              [](const actions::set_speed&) { return std::string(action_names::set_speed); },
                              [](const actions::deploy_blueprint&)
                              { return std::string(action_names::blueprint_deploy); },
                              [](const actions::get_buildings&)
                              { return std::string(action_names::info_get_buildings); },
                              [](const actions::raw_action& raw) { return raw.name; },
                          },
            action);
    }

    nlohmann::json action_payload(const request_action& action)
    {
        return std::visit(
            overloaded{
                [](const actions::get_state&) { return nlohmann::json::object(); },
                [](const actions::build& a) -> nlohmann::json
                { return {{"buildingId", a.building_id}, {"cell", cell_json(a.target)}}; },
                [](const actions::cancel_build& a) -> nlohmann::json { return {{"cell", cell_json(a.target)}}; },
                [](const actions::dig& a) -> nlohmann::json { return {{"cell", cell_json(a.target)}}; },
                [](const actions::cancel_dig& a) -> nlohmann::json { return {{"cell", cell_json(a.target)}}; },
                [](const actions::set_priority& a) -> nlohmann::json
                { return {{"cell", cell_json(a.target)}, {"priority", clamp_priority(a.priority)}}; },
                [](const actions::set_speed& a) -> nlohmann::json { return {{"speed", clamp_speed(a.speed)}}; },
                [](const actions::deploy_blueprint& a) { return a.blueprint; },
                [](const actions::get_buildings&) { return nlohmann::json::object(); },
                [](const actions::raw_action& raw) { return raw.payload; },
            },
            action);
    }

    request_action parse_action(std::string_view name, const nlohmann::json& payload)
    {
        try
        {
            if (name == action_names::state_get)
                return actions::get_state{};
            if (name == action_names::info_get_buildings)
                return actions::get_buildings{};
            if (name == action_names::blueprint_deploy)
                return actions::deploy_blueprint{payload};
            if (name == action_names::build)
                return actions::build{payload.at("buildingId").get<std::string>(), read_cell(payload)};
            if (name == action_names::cancel_build)
                return actions::cancel_build{read_cell(payload)};
            if (name == action_names::dig)
                return actions::dig{read_cell(payload)};
            if (name == action_names::cancel_dig)
                return actions::cancel_dig{read_cell(payload)};
            if (name == action_names::set_priority)
                return actions::set_priority{read_cell(payload), payload.at("priority").get<int>()};
            if (name == action_names::set_speed)
                return actions::set_speed{payload.at("speed").get<int>()};
        }
        catch (const nlohmann::json::exception& ex)
        {
            COLONY_DEBUG("payload for {} does not match its typed form, sending as is: {}", name, ex.what());
        }
        return actions::raw_action{std::string(name), payload};
    }
}
