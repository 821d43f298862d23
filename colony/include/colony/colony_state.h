/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace colony
{
    struct vector2
    {
        double x = 0;
        double y = 0;
    };

    struct world_state
    {
        int64_t cycle = 0;
        double time_of_day = 0;
        int64_t world_seed = 0;
        std::string asteroid_name;
        std::array<double, 2> temperature_range{0, 0};
        std::array<double, 2> pressure_range{0, 0};
    };

    struct duplicant_state
    {
        std::string id;
        std::string name;
        vector2 position;
        double health = 100;
        double stress = 0;
        double calories = 4000;
        double oxygen = 100;
        double bladder = 0;
        double stamina = 100;
        std::optional<std::string> current_task;
        std::vector<std::string> skills;
        std::vector<std::string> traits;
    };

    struct building_info
    {
        std::string id;
        std::string name;
        vector2 position;
        bool enabled = false;
        double health = 0;
        double max_health = 100;
        double temperature = 0;
        std::map<std::string, double> storage;
    };

    struct resource_info
    {
        std::string name;
        double available = 0;
        double capacity = 0;
        double delta_per_cycle = 0;
    };

    struct chore_status
    {
        std::string id;
        std::string name;
        int priority = 0;
        std::optional<std::string> assigned_to;
        double progress = 0;
    };

    struct cell_info
    {
        vector2 position;
        double temperature = 0;
        double pressure = 0;
        double mass = 0;
        std::string element;
        bool solid = false;
        bool liquid = false;
        bool gas = false;
    };

    /**
     * @brief Snapshot of the simulated world as returned by State.Get
     *
     * Decoding is lenient: absent fields keep the defaults above. A field that is present
     * with the wrong JSON type makes from_json throw nlohmann::json::type_error.
     * The timestamp is kept exactly as the server sent it (ISO 8601 text).
     */
    struct colony_state
    {
        std::string timestamp;
        world_state world;
        std::vector<duplicant_state> duplicants;
        std::vector<building_info> buildings;
        std::vector<resource_info> resources;
        std::vector<chore_status> chores;
        std::vector<cell_info> cells;
        std::vector<std::string> alerts;
    };

    void from_json(const nlohmann::json& j, vector2& v);
    void to_json(nlohmann::json& j, const vector2& v);
    void from_json(const nlohmann::json& j, world_state& w);
    void to_json(nlohmann::json& j, const world_state& w);
    void from_json(const nlohmann::json& j, duplicant_state& d);
    void to_json(nlohmann::json& j, const duplicant_state& d);
    void from_json(const nlohmann::json& j, building_info& b);
    void to_json(nlohmann::json& j, const building_info& b);
    void from_json(const nlohmann::json& j, resource_info& r);
    void to_json(nlohmann::json& j, const resource_info& r);
    void from_json(const nlohmann::json& j, chore_status& c);
    void to_json(nlohmann::json& j, const chore_status& c);
    void from_json(const nlohmann::json& j, cell_info& c);
    void to_json(nlohmann::json& j, const cell_info& c);
    void from_json(const nlohmann::json& j, colony_state& s);
    void to_json(nlohmann::json& j, const colony_state& s);
}
