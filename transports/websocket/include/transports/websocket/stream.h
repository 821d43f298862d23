/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <span>
#include <utility>

#include <coro/coro.hpp>

namespace colony
{
    namespace websocket
    {
        // Byte stream a websocket_connection runs over
        class stream
        {
        public:
            virtual ~stream() = default;

            virtual auto poll(coro::poll_op op, std::chrono::milliseconds timeout = std::chrono::milliseconds{0})
                -> coro::task<coro::poll_status>
                = 0;

            virtual auto recv(std::span<char> buffer) -> std::pair<coro::net::recv_status, std::span<char>> = 0;

            virtual auto send(std::span<const char> buffer) -> std::pair<coro::net::send_status, std::span<const char>> = 0;

            virtual bool is_closed() const = 0;

            virtual void set_closed() = 0;

            // Shuts the socket down so a pending poll wakes up
            virtual void shutdown() = 0;
        };
    }
}
