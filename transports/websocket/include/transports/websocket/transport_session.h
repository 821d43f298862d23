/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <coro/coro.hpp>

#include <transports/websocket/connection_state.h>
#include <transports/websocket/reconnect_policy.h>
#include <transports/websocket/websocket_connection.h>

namespace colony
{
    namespace websocket
    {
        struct session_options
        {
            // used to tag log lines, e.g. "command" or "event"
            std::string name = "session";
            std::string url;
            // covers the TCP connect and the upgrade handshake together
            std::chrono::milliseconds connect_timeout{5000};
            reconnect_policy reconnect;
            connection_options connection;
        };

        /**
         * @brief Keeps one WebSocket connection to a fixed endpoint alive
         *
         * run() loops while the session is running: connect, pump inbound text frames to the
         * frame handler until the socket closes or fails, wait for the reconnect policy's
         * delay and try again. Every state change is reported to the registered observers
         * synchronously from the run() task.
         *
         * close() stops the loop and completes only once run() has unwound; it may be called
         * any number of times, and before run() was ever started.
         *
         * Sessions are created with create() and must outlive any task spawned on run().
         */
        class transport_session : public std::enable_shared_from_this<transport_session>
        {
        public:
            using frame_handler = std::function<void(std::string frame)>;
            using state_observer = std::function<void(connection_state state)>;

            static std::shared_ptr<transport_session> create(
                std::shared_ptr<coro::io_scheduler> scheduler, session_options options);

            ~transport_session();

            transport_session(const transport_session&) = delete;
            transport_session& operator=(const transport_session&) = delete;

            void set_frame_handler(frame_handler handler);
            void add_state_observer(state_observer observer);

            // A single connection attempt, including the upgrade handshake
            coro::task<int> connect();

            coro::task<void> run();

            // Spawns run() on the scheduler, the spawned task keeps the session alive
            bool start();

            // CONNECTION_ERROR unless connected, otherwise queues a text frame
            int send(std::string frame);

            coro::task<void> close();

            // Drops the current connection without a close handshake, the run loop reconnects
            void drop_connection();

            connection_state get_state() const { return state_; }
            bool is_connected() const { return state_ == connection_state::connected; }
            bool is_running() const { return running_; }
            const session_options& get_options() const { return options_; }
            std::shared_ptr<coro::io_scheduler> get_scheduler() const { return scheduler_; }

        private:
            transport_session(std::shared_ptr<coro::io_scheduler> scheduler, session_options options);

            static coro::task<void> run_and_release(std::shared_ptr<transport_session> self);

            void set_state(connection_state new_state);
            coro::task<void> sleep_while_running(std::chrono::milliseconds delay);

            std::shared_ptr<coro::io_scheduler> scheduler_;
            session_options options_;

            frame_handler frame_handler_;
            std::vector<state_observer> observers_;
            std::mutex observers_mutex_;

            std::shared_ptr<websocket_connection> connection_;
            std::mutex connection_mutex_;

            std::atomic<connection_state> state_{connection_state::disconnected};
            std::atomic<bool> running_{false};
            std::atomic<bool> run_started_{false};
            std::atomic<bool> loop_active_{false};
            std::atomic<bool> closed_{false};
            coro::event stopped_;
        };
    }
}
