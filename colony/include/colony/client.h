/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <coro/coro.hpp>
#include <nlohmann/json.hpp>

#include <colony/actions.h>
#include <colony/colony_state.h>
#include <colony/command_channel.h>
#include <colony/event_channel.h>
#include <transports/websocket/reconnect_policy.h>

namespace colony
{
    struct client_options
    {
        std::string command_url = "ws://localhost:8080";
        std::string event_url = "ws://localhost:8181";
        std::chrono::milliseconds request_timeout{30000};
        std::chrono::milliseconds connect_timeout{5000};
        websocket::reconnect_policy reconnect;
        event_channel_options events;
    };

    /**
     * @brief Typed access to a running colony simulation
     *
     * Composes one command_channel and one event_channel, each on its own transport_session.
     * The two channels share nothing: losing one connection neither cancels nor delays the
     * other.
     *
     * Every domain operation returns an error code. Operations that only acknowledge an
     * action fill a success flag taken from the response's "success" field, which is false
     * when absent. A response whose payload cannot be decoded into the typed result yields
     * INVALID_DATA.
     */
    class client
    {
    public:
        explicit client(std::shared_ptr<coro::io_scheduler> scheduler, client_options options = {});
        ~client();

        client(const client&) = delete;
        client& operator=(const client&) = delete;

        // Starts both sessions in the background, returns immediately. On failure neither
        // session is left running.
        bool connect();

        // Stops both sessions, cancels outstanding requests and waits for background tasks.
        // Idempotent, and a no-op when connect() was never called. A call made while another
        // disconnect is in progress returns once that one has finished.
        coro::task<void> disconnect();

        // true once both channels are connected, false on timeout
        coro::task<bool> wait_until_connected(std::chrono::milliseconds timeout);

        bool is_connected() const;
        websocket::connection_state command_state() const;
        websocket::connection_state event_state() const;

        coro::task<int> send_request(const request_action& action, nlohmann::json& response);

        coro::task<int> get_state(colony_state& state);
        coro::task<int> build(std::string building_id, int x, int y, bool& success);
        coro::task<int> cancel_build(int x, int y, bool& success);
        coro::task<int> dig(int x, int y, bool& success);
        coro::task<int> cancel_dig(int x, int y, bool& success);
        coro::task<int> set_priority(int x, int y, int priority, bool& success);
        coro::task<int> set_speed(int speed, bool& success);
        coro::task<int> pause(bool& success);
        coro::task<int> resume(bool& success);
        coro::task<int> deploy_blueprint(nlohmann::json blueprint, bool& success);
        coro::task<int> get_available_buildings(nlohmann::json& buildings);

        coro::task<std::optional<event>> get_events(std::chrono::milliseconds timeout = std::chrono::milliseconds{100});

        const std::shared_ptr<command_channel>& get_command_channel() const { return command_; }
        const std::shared_ptr<event_channel>& get_event_channel() const { return events_; }
        std::shared_ptr<coro::io_scheduler> get_scheduler() const { return scheduler_; }
        const client_options& get_options() const { return options_; }

    private:
        coro::task<int> acknowledge(request_action action, bool& success);

        std::shared_ptr<coro::io_scheduler> scheduler_;
        client_options options_;
        std::shared_ptr<command_channel> command_;
        std::shared_ptr<event_channel> events_;
        bool started_ = false;
        bool stopping_ = false;
        coro::event stopped_;
    };
}
