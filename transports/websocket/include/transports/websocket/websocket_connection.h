/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <coro/coro.hpp>
#include <wslay/wslay.h>

#include <transports/websocket/stream.h>

namespace colony
{
    namespace websocket
    {
        enum class connection_role
        {
            client, // masks outbound frames
            server
        };

        struct connection_options
        {
            // how long a locally initiated close waits for the peer's close frame
            std::chrono::milliseconds close_grace{1000};
            // upper bound on a single poll, outbound frames are picked up at least this often
            std::chrono::milliseconds poll_interval{10};
            size_t max_message_length = 16 * 1024 * 1024;
        };

        /**
         * @brief RFC 6455 framing over an already upgraded stream
         *
         * run() is the only task that touches the socket. send_text() never blocks: it
         * appends to an outbox that run() drains into wslay at the top of each iteration,
         * so a caller resumed from inside the message handler cannot deadlock on the
         * framing lock. Received text messages are collected while wslay is locked and
         * handed to the handler after the lock is released.
         */
        class websocket_connection
        {
        public:
            using message_handler = std::function<void(std::string message)>;

            // initial_bytes are any bytes read past the end of the HTTP upgrade
            websocket_connection(std::shared_ptr<stream> stream,
                connection_role role,
                std::string initial_bytes = {},
                connection_options options = {});
            ~websocket_connection();

            websocket_connection(const websocket_connection&) = delete;
            websocket_connection& operator=(const websocket_connection&) = delete;
            websocket_connection(websocket_connection&&) = delete;
            websocket_connection& operator=(websocket_connection&&) = delete;

            // Pumps frames until the close handshake completes or the stream fails.
            // Returns OK for an orderly close and TRANSPORT_ERROR otherwise.
            coro::task<int> run(message_handler handler);

            // CONNECTION_ERROR once the connection is closing or closed
            int send_text(std::string message);

            // Starts the close handshake
            void close(uint16_t status_code = WSLAY_CODE_NORMAL_CLOSURE);

            // Drops the socket without a close handshake
            void abort();

            bool is_open() const { return open_ && !close_requested_; }

        private:
            static ssize_t send_callback(
                wslay_event_context_ptr ctx, const uint8_t* data, size_t len, int flags, void* user_data);

            static ssize_t recv_callback(wslay_event_context_ptr ctx, uint8_t* buf, size_t len, int flags, void* user_data);

            static int genmask_callback(wslay_event_context_ptr ctx, uint8_t* buf, size_t len, void* user_data);

            static void on_msg_recv_callback(
                wslay_event_context_ptr ctx, const wslay_event_on_msg_recv_arg* arg, void* user_data);

            void drain_outbox();
            int feed_wslay();
            void dispatch(const message_handler& handler);

            std::shared_ptr<stream> stream_;
            connection_role role_;
            connection_options options_;

            std::string read_buffer_;
            size_t read_buffer_pos_{0};
            wslay_event_context_ptr wslay_ctx_{nullptr};
            std::mutex wslay_mutex_;
            std::vector<std::string> received_;

            // kept apart from wslay_mutex_ so send_text never waits on the pump
            std::deque<std::string> outbox_;
            std::mutex outbox_mutex_;

            std::atomic<bool> open_{true};
            std::atomic<bool> close_requested_{false};
            std::atomic<bool> abort_requested_{false};
            std::atomic<uint16_t> close_code_{WSLAY_CODE_NORMAL_CLOSURE};
            bool close_queued_ = false;
            std::chrono::steady_clock::time_point close_deadline_;
        };
    }
}
