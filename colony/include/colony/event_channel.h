/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <coro/coro.hpp>
#include <nlohmann/json.hpp>

#include <colony/bounded_queue.h>
#include <transports/websocket/transport_session.h>

namespace colony
{
    // A server pushed event, in the order it arrived
    struct event
    {
        // empty when the frame carried no type
        std::string type;
        nlohmann::json payload;
        // the whole decoded frame
        nlohmann::json frame;
        uint64_t sequence = 0;
        std::chrono::system_clock::time_point received_at;
    };

    struct event_channel_options
    {
        size_t capacity = 1024;
        overflow_policy policy = overflow_policy::drop_oldest;
        // how often get_event re-checks an empty queue
        std::chrono::milliseconds poll_interval{5};
    };

    /**
     * @brief Streams server pushed events from one transport_session into a bounded FIFO
     *
     * Frames must decode to a JSON object, anything else is logged and dropped. Event types
     * are not interpreted here. When the queue is full the overflow policy decides which
     * event is lost; losses are counted.
     */
    class event_channel : public std::enable_shared_from_this<event_channel>
    {
    public:
        static std::shared_ptr<event_channel> create(
            std::shared_ptr<websocket::transport_session> session, event_channel_options options = {});

        event_channel(const event_channel&) = delete;
        event_channel& operator=(const event_channel&) = delete;

        bool start();
        coro::task<void> stop();

        // Next event, or std::nullopt if none arrived within timeout
        coro::task<std::optional<event>> get_event(std::chrono::milliseconds timeout);

        std::optional<event> try_get_event() { return queue_.try_pop(); }

        size_t size() const { return queue_.size(); }
        uint64_t dropped_count() const { return queue_.dropped_count(); }
        websocket::connection_state get_state() const { return session_->get_state(); }
        const std::shared_ptr<websocket::transport_session>& get_session() const { return session_; }

    private:
        event_channel(std::shared_ptr<websocket::transport_session> session, event_channel_options options);

        void on_frame(std::string text);

        std::shared_ptr<websocket::transport_session> session_;
        event_channel_options options_;
        bounded_queue<event> queue_;
        std::atomic<uint64_t> next_sequence_{0};
    };
}
