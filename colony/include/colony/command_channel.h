/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include <coro/coro.hpp>
#include <nlohmann/json.hpp>

#include <colony/actions.h>
#include <colony/correlation_table.h>
#include <transports/websocket/transport_session.h>

namespace colony
{
    // Random 128 bit id formatted as a version 4 UUID
    std::string generate_request_id();

    struct command_channel_options
    {
        std::chrono::milliseconds default_timeout{30000};
        // how often an outstanding request checks its deadline
        std::chrono::milliseconds deadline_check_interval{20};
    };

    /**
     * @brief Correlated request/response calls over one transport_session
     *
     * Each request gets a fresh id, is recorded in the correlation table, sent as
     * {requestId, action, payload} and then awaited. Exactly one of three things ends the
     * wait: the matching response (OK), the deadline (TIMED_OUT) or the connection going
     * away (CALL_CANCELLED). A request issued while the session is not connected fails
     * straight away with CONNECTION_ERROR and is never queued.
     *
     * Responses are matched purely by id so they may arrive in any order. Frames that do
     * not decode, carry no requestId, or name an id nobody is waiting for are logged and
     * dropped without touching the table.
     */
    class command_channel : public std::enable_shared_from_this<command_channel>
    {
    public:
        static std::shared_ptr<command_channel> create(
            std::shared_ptr<websocket::transport_session> session, command_channel_options options = {});

        command_channel(const command_channel&) = delete;
        command_channel& operator=(const command_channel&) = delete;

        // Spawns the session's run loop
        bool start();

        // Closes the session, cancels everything outstanding and waits for the deadline watchers
        coro::task<void> stop();

        // response receives the whole decoded response frame
        coro::task<int> send_request(
            std::string action, nlohmann::json payload, nlohmann::json& response, std::chrono::milliseconds timeout);
        coro::task<int> send_request(std::string action, nlohmann::json payload, nlohmann::json& response);
        coro::task<int> send_request(
            const request_action& action, nlohmann::json& response, std::chrono::milliseconds timeout);
        coro::task<int> send_request(const request_action& action, nlohmann::json& response);

        size_t pending_count() const { return table_.size(); }
        websocket::connection_state get_state() const { return session_->get_state(); }
        const std::shared_ptr<websocket::transport_session>& get_session() const { return session_; }
        const command_channel_options& get_options() const { return options_; }

    private:
        command_channel(std::shared_ptr<websocket::transport_session> session, command_channel_options options);

        void on_frame(std::string text);
        void on_state(websocket::connection_state state);

        static coro::task<void> watch_deadline(
            std::shared_ptr<command_channel> self, std::shared_ptr<pending_request> request);

        std::shared_ptr<websocket::transport_session> session_;
        command_channel_options options_;
        correlation_table table_;
        std::atomic<int> watchers_{0};
    };
}
