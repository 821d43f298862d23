/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>

#include <coro/coro.hpp>
#include <nlohmann/json.hpp>

#include <colony/actions.h>
#include <colony/bounded_queue.h>
#include <colony/client.h>
#include <colony/colony_state.h>
#include <colony/event_channel.h>

namespace colony
{
    // outcome of a command posted to a session_worker
    struct command_result
    {
        uint64_t id = 0;
        int error_code = error::OK();
        // the decoded response frame, null unless error_code is OK
        nlohmann::json result;
    };

    struct state_update
    {
        colony_state state;
    };

    struct connection_status
    {
        websocket::connection_state command = websocket::connection_state::disconnected;
        websocket::connection_state events = websocket::connection_state::disconnected;
    };

    using worker_message = std::variant<command_result, event, state_update, connection_status>;

    /**
     * @brief Runs a client on its own thread for consumers that have a loop of their own
     *
     * The worker thread owns a manual io_scheduler and the client. The consumer talks to it
     * through queues only: post() hands a command in, poll() takes results, events and
     * status changes out. Nothing is shared by reference across the threads.
     *
     * Command results are never evicted. post() refuses a command while inbound_capacity
     * results are still unpolled, so the result queue cannot overflow. Only the newest
     * connection_status is kept. Events and state updates share a drop-oldest queue of
     * outbound_capacity entries, and poll() hands out results and status before them.
     *
     * An event whose type equals options::state_event_type is delivered as the raw event
     * and additionally decoded into a state_update.
     */
    class session_worker
    {
    public:
        struct options
        {
            client_options client;
            size_t inbound_capacity = 256;
            size_t outbound_capacity = 4096;
            // how often the worker picks up posted commands
            std::chrono::milliseconds command_poll_interval{10};
            std::chrono::milliseconds event_wait{100};
            std::string state_event_type = "State.Update";
        };

        explicit session_worker(options opts);
        ~session_worker();

        session_worker(const session_worker&) = delete;
        session_worker& operator=(const session_worker&) = delete;

        bool start();

        // Disconnects the client and joins the worker thread
        void stop();

        // Returns the id that will tag the command_result, 0 if the worker is not running, its
        // command queue is full or inbound_capacity results are still waiting to be polled
        uint64_t post(request_action action);

        std::optional<worker_message> poll();

        bool is_running() const { return running_; }

        // events and state updates lost because the consumer fell behind
        uint64_t dropped_events() const { return outbound_.dropped_count(); }

    private:
        struct posted_command
        {
            uint64_t id = 0;
            request_action action;
        };

        void thread_main();
        coro::task<void> main_loop(std::shared_ptr<coro::io_scheduler> scheduler);
        coro::task<void> pump_events();
        coro::task<void> run_command(posted_command command);
        void report_status();
        void push_result(command_result result);

        options options_;
        bounded_queue<posted_command> inbound_;
        bounded_queue<command_result> results_;
        bounded_queue<worker_message> outbound_;
        // accepted by post() and not yet returned by poll()
        std::atomic<size_t> unanswered_{0};

        std::mutex status_mutex_;
        std::optional<connection_status> pending_status_;

        std::thread thread_;
        std::atomic<bool> running_{false};
        std::atomic<bool> stop_requested_{false};
        std::atomic<uint64_t> next_id_{1};

        // worker thread only
        std::unique_ptr<client> client_;
        int active_tasks_ = 0;
        std::optional<connection_status> last_status_;
    };
}
