/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>

#include <coro/coro.hpp>
#include <fmt/format.h>

#include <colony/colony.h>

namespace
{
    struct console_options
    {
        colony::client_options client;
        std::chrono::seconds events_duration{10};
        bool verbose = false;
    };

    void print_usage(const char* program)
    {
        std::cout << "Usage: " << program << " [options]\n"
                  << "Options:\n"
                  << "  --command-url <url>     Command endpoint (default: ws://localhost:8080)\n"
                  << "  --event-url <url>       Event endpoint (default: ws://localhost:8181)\n"
                  << "  --timeout-ms <n>        Request timeout in milliseconds (default: 30000)\n"
                  << "  --reconnect-ms <n>      Delay between reconnect attempts (default: 5000)\n"
                  << "  --events-seconds <n>    How long to print events for (default: 10)\n"
                  << "  --verbose               Debug logging\n"
                  << "  --help                  Show this help message\n";
    }

    void print_state(const colony::colony_state& state)
    {
        fmt::print("cycle {} ({:.2f}) on {}\n", state.world.cycle, state.world.time_of_day, state.world.asteroid_name);
        fmt::print("  duplicants: {}\n", state.duplicants.size());
        for (const auto& dupe : state.duplicants)
        {
            fmt::print("    {:<16} health {:>5.1f} stress {:>5.1f} task {}\n",
                dupe.name,
                dupe.health,
                dupe.stress,
                dupe.current_task.value_or("-"));
        }
        fmt::print("  buildings: {}\n", state.buildings.size());
        fmt::print("  resources: {}\n", state.resources.size());
        for (const auto& resource : state.resources)
        {
            fmt::print("    {:<16} {:>10.1f} ({:+.1f}/cycle)\n", resource.name, resource.available, resource.delta_per_cycle);
        }
        for (const auto& alert : state.alerts)
        {
            fmt::print("  alert: {}\n", alert);
        }
    }

    coro::task<int> run_console(std::shared_ptr<coro::io_scheduler> scheduler, console_options options)
    {
        co_await scheduler->schedule();

        colony::client client(scheduler, options.client);
        if (!client.connect())
        {
            COLONY_ERROR("unable to start the client sessions");
            co_return 1;
        }

        if (!co_await client.wait_until_connected(options.client.connect_timeout))
        {
            COLONY_WARNING("not connected after {} ms, requests will fail until the server is reachable",
                options.client.connect_timeout.count());
        }

        colony::colony_state state;
        int err = co_await client.get_state(state);
        if (err == colony::error::OK())
        {
            print_state(state);
        }
        else
        {
            COLONY_ERROR("State.Get failed: {}", colony::error::to_string(err));
        }

        nlohmann::json buildings;
        err = co_await client.get_available_buildings(buildings);
        if (err == colony::error::OK())
        {
            fmt::print("{} buildings available\n", buildings.size());
        }

        auto deadline = std::chrono::steady_clock::now() + options.events_duration;
        while (std::chrono::steady_clock::now() < deadline)
        {
            auto ev = co_await client.get_events(std::chrono::milliseconds{250});
            if (ev)
            {
                fmt::print("event #{} {}: {}\n", ev->sequence, ev->type.empty() ? "<untyped>" : ev->type, ev->payload.dump());
            }
        }

        co_await client.disconnect();
        co_return err == colony::error::OK() ? 0 : 1;
    }

    bool parse_count(const std::string& text, int64_t& out)
    {
        try
        {
            out = std::stoll(text);
            return out >= 0;
        }
        catch (const std::exception&)
        {
            return false;
        }
    }
}

auto main(int argc, char* argv[]) -> int
{
    console_options options;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        int64_t value = 0;
        if (arg == "--command-url" && i + 1 < argc)
        {
            options.client.command_url = argv[++i];
        }
        else if (arg == "--event-url" && i + 1 < argc)
        {
            options.client.event_url = argv[++i];
        }
        else if (arg == "--timeout-ms" && i + 1 < argc && parse_count(argv[++i], value))
        {
            options.client.request_timeout = std::chrono::milliseconds(value);
        }
        else if (arg == "--reconnect-ms" && i + 1 < argc && parse_count(argv[++i], value))
        {
            options.client.reconnect = colony::websocket::reconnect_policy::constant_delay(std::chrono::milliseconds(value));
        }
        else if (arg == "--events-seconds" && i + 1 < argc && parse_count(argv[++i], value))
        {
            options.events_duration = std::chrono::seconds(value);
        }
        else if (arg == "--verbose")
        {
            options.verbose = true;
        }
        else if (arg == "--help")
        {
            print_usage(argv[0]);
            return 0;
        }
        else
        {
            std::cerr << "Invalid argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    colony::set_log_level(options.verbose ? colony::debug : colony::info);

    // writes to a socket the server already closed must not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    auto scheduler = coro::io_scheduler::make_shared(
        coro::io_scheduler::options{.thread_strategy = coro::io_scheduler::thread_strategy_t::spawn,
            .execution_strategy = coro::io_scheduler::execution_strategy_t::process_tasks_inline});

    auto result = coro::sync_wait(run_console(scheduler, options));
    scheduler->shutdown();
    return result;
}
