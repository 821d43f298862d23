/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <colony/colony_state.h>

namespace colony
{
    namespace
    {
        // null counts as absent
        template<class T> T value_or(const nlohmann::json& j, const char* key, T fallback)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
                return fallback;
            return it->get<T>();
        }

        std::optional<std::string> optional_string(const nlohmann::json& j, const char* key)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
                return std::nullopt;
            return it->get<std::string>();
        }

        nlohmann::json optional_json(const std::optional<std::string>& value)
        {
            if (!value)
                return nullptr;
            return *value;
        }

        // [low, high], anything shorter decodes as [0, 0]
        std::array<double, 2> read_range(const nlohmann::json& j, const char* key)
        {
            auto it = j.find(key);
            if (it == j.end() || !it->is_array() || it->size() < 2)
                return {0, 0};
            return {(*it)[0].get<double>(), (*it)[1].get<double>()};
        }

        template<class T> std::vector<T> read_list(const nlohmann::json& j, const char* key)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
                return {};
            return it->get<std::vector<T>>();
        }

        vector2 read_position(const nlohmann::json& j)
        {
            auto it = j.find("position");
            if (it == j.end() || it->is_null())
                return {};
            return it->get<vector2>();
        }
    }

    void from_json(const nlohmann::json& j, vector2& v)
    {
        v.x = value_or(j, "x", 0.0);
        v.y = value_or(j, "y", 0.0);
    }

    void to_json(nlohmann::json& j, const vector2& v)
    {
        j = {{"x", v.x}, {"y", v.y}};
    }

    void from_json(const nlohmann::json& j, world_state& w)
    {
        w.cycle = value_or(j, "cycle", int64_t{0});
        w.time_of_day = value_or(j, "timeOfDay", 0.0);
        w.world_seed = value_or(j, "worldSeed", int64_t{0});
        w.asteroid_name = value_or(j, "asteroidName", std::string());
        w.temperature_range = read_range(j, "temperatureRange");
        w.pressure_range = read_range(j, "pressureRange");
    }

    void to_json(nlohmann::json& j, const world_state& w)
    {
        j = {{"cycle", w.cycle},
            {"timeOfDay", w.time_of_day},
            {"worldSeed", w.world_seed},
            {"asteroidName", w.asteroid_name},
            {"temperatureRange", w.temperature_range},
            {"pressureRange", w.pressure_range}};
    }

    void from_json(const nlohmann::json& j, duplicant_state& d)
    {
        d.id = value_or(j, "id", std::string());
        d.name = value_or(j, "name", std::string());
        d.position = read_position(j);
        d.health = value_or(j, "health", 100.0);
        d.stress = value_or(j, "stress", 0.0);
        d.calories = value_or(j, "calories", 4000.0);
        d.oxygen = value_or(j, "oxygen", 100.0);
        d.bladder = value_or(j, "bladder", 0.0);
        d.stamina = value_or(j, "stamina", 100.0);
        d.current_task = optional_string(j, "currentTask");
        d.skills = read_list<std::string>(j, "skills");
        d.traits = read_list<std::string>(j, "traits");
    }

    void to_json(nlohmann::json& j, const duplicant_state& d)
    {
        j = {{"id", d.id},
            {"name", d.name},
            {"position", d.position},
            {"health", d.health},
            {"stress", d.stress},
            {"calories", d.calories},
            {"oxygen", d.oxygen},
            {"bladder", d.bladder},
            {"stamina", d.stamina},
            {"currentTask", optional_json(d.current_task)},
            {"skills", d.skills},
            {"traits", d.traits}};
    }

    void from_json(const nlohmann::json& j, building_info& b)
    {
        b.id = value_or(j, "id", std::string());
        b.name = value_or(j, "name", std::string());
        b.position = read_position(j);
        b.enabled = value_or(j, "enabled", false);
        b.health = value_or(j, "health", 0.0);
        b.max_health = value_or(j, "maxHealth", 100.0);
        b.temperature = value_or(j, "temperature", 0.0);
        b.storage = value_or(j, "storage", std::map<std::string, double>());
    }

    void to_json(nlohmann::json& j, const building_info& b)
    {
        j = {{"id", b.id},
            {"name", b.name},
            {"position", b.position},
            {"enabled", b.enabled},
            {"health", b.health},
            {"maxHealth", b.max_health},
            {"temperature", b.temperature},
            {"storage", b.storage}};
    }

    void from_json(const nlohmann::json& j, resource_info& r)
    {
        r.name = value_or(j, "name", std::string());
        r.available = value_or(j, "available", 0.0);
        r.capacity = value_or(j, "capacity", 0.0);
        r.delta_per_cycle = value_or(j, "deltaPerCycle", 0.0);
    }

    void to_json(nlohmann::json& j, const resource_info& r)
    {
        j = {{"name", r.name}, {"available", r.available}, {"capacity", r.capacity}, {"deltaPerCycle", r.delta_per_cycle}};
    }

    void from_json(const nlohmann::json& j, chore_status& c)
    {
        c.id = value_or(j, "id", std::string());
        c.name = value_or(j, "name", std::string());
        c.priority = value_or(j, "priority", 0);
        c.assigned_to = optional_string(j, "assignedTo");
        c.progress = value_or(j, "progress", 0.0);
    }

    void to_json(nlohmann::json& j, const chore_status& c)
    {
        j = {{"id", c.id},
            {"name", c.name},
            {"priority", c.priority},
            {"assignedTo", optional_json(c.assigned_to)},
            {"progress", c.progress}};
    }

    void from_json(const nlohmann::json& j, cell_info& c)
    {
        c.position = read_position(j);
        c.temperature = value_or(j, "temperature", 0.0);
        c.pressure = value_or(j, "pressure", 0.0);
        c.mass = value_or(j, "mass", 0.0);
        c.element = value_or(j, "element", std::string());
        c.solid = value_or(j, "solid", false);
        c.liquid = value_or(j, "liquid", false);
        c.gas = value_or(j, "gas", false);
    }

    void to_json(nlohmann::json& j, const cell_info& c)
    {
        j = {{"position", c.position},
            {"temperature", c.temperature},
            {"pressure", c.pressure},
            {"mass", c.mass},
            {"element", c.element},
            {"solid", c.solid},
            {"liquid", c.liquid},
            {"gas", c.gas}};
    }

    void from_json(const nlohmann::json& j, colony_state& s)
    {
        s.timestamp = value_or(j, "timestamp", std::string());
        auto world = j.find("world");
        s.world = (world == j.end() || world->is_null()) ? world_state{} : world->get<world_state>();
        s.duplicants = read_list<duplicant_state>(j, "duplicants");
        s.buildings = read_list<building_info>(j, "buildings");
        s.resources = read_list<resource_info>(j, "resources");
        s.chores = read_list<chore_status>(j, "chores");
        s.cells = read_list<cell_info>(j, "cells");
        s.alerts = read_list<std::string>(j, "alerts");
    }

    void to_json(nlohmann::json& j, const colony_state& s)
    {
        j = {{"timestamp", s.timestamp},
            {"world", s.world},
            {"duplicants", s.duplicants},
            {"buildings", s.buildings},
            {"resources", s.resources},
            {"chores", s.chores},
            {"cells", s.cells},
            {"alerts", s.alerts}};
    }
}
