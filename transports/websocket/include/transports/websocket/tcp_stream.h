/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <atomic>

#include <transports/websocket/stream.h>

namespace colony
{
    namespace websocket
    {
        class tcp_stream : public stream
        {
        public:
            explicit tcp_stream(coro::net::tcp::client&& client);
            ~tcp_stream() override;

            auto poll(coro::poll_op op, std::chrono::milliseconds timeout = std::chrono::milliseconds{0})
                -> coro::task<coro::poll_status> override;

            auto recv(std::span<char> buffer) -> std::pair<coro::net::recv_status, std::span<char>> override;

            auto send(std::span<const char> buffer) -> std::pair<coro::net::send_status, std::span<const char>> override;

            bool is_closed() const override;

            void set_closed() override;

            void shutdown() override;

        private:
            coro::net::tcp::client client_;
            std::atomic<bool> closed_{false};
        };
    }
}
