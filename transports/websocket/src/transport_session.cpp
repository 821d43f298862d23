/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>

#include <colony/error_codes.h>
#include <colony/logging.h>
#include <transports/websocket/handshake.h>
#include <transports/websocket/tcp_stream.h>
#include <transports/websocket/transport_session.h>
#include <transports/websocket/url.h>

namespace colony::websocket
{
    namespace
    {
        constexpr std::chrono::milliseconds sleep_slice{50};
        constexpr size_t handshake_chunk_size = 4096;

        std::chrono::milliseconds remaining_until(std::chrono::steady_clock::time_point deadline)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            // a zero poll timeout means wait forever
            return std::max(left, std::chrono::milliseconds{1});
        }
    }

    std::shared_ptr<transport_session> transport_session::create(
        std::shared_ptr<coro::io_scheduler> scheduler, session_options options)
    {
        return std::shared_ptr<transport_session>(new transport_session(std::move(scheduler), std::move(options)));
    }

    transport_session::transport_session(std::shared_ptr<coro::io_scheduler> scheduler, session_options options)
        : scheduler_(std::move(scheduler))
        , options_(std::move(options))
    {
    }

    transport_session::~transport_session()
    {
        COLONY_DEBUG("[{}] transport_session destroyed", options_.name);
    }

    void transport_session::set_frame_handler(frame_handler handler)
    {
        frame_handler_ = std::move(handler);
    }

    void transport_session::add_state_observer(state_observer observer)
    {
        std::scoped_lock lock(observers_mutex_);
        observers_.push_back(std::move(observer));
    }

    void transport_session::set_state(connection_state new_state)
    {
        auto old_state = state_.exchange(new_state);
        if (old_state == new_state)
            return;

        COLONY_DEBUG("[{}] {} -> {}", options_.name, to_string(old_state), to_string(new_state));

        std::vector<state_observer> observers;
        {
            std::scoped_lock lock(observers_mutex_);
            observers = observers_;
        }
        for (auto& observer : observers)
        {
            observer(new_state);
        }
    }

    coro::task<int> transport_session::connect()
    {
        endpoint target;
        int err = parse_ws_url(options_.url, target);
        if (err != error::OK())
            co_return err;

        std::string address;
        err = resolve_ipv4(target.host, address);
        if (err != error::OK())
            co_return err;

        auto deadline = std::chrono::steady_clock::now() + options_.connect_timeout;

        coro::net::tcp::client client(scheduler_,
            coro::net::tcp::client::options{
                .address = {coro::net::ip_address::from_string(address)},
                .port = target.port,
            });

        auto connection_status = co_await client.connect(options_.connect_timeout);
        if (connection_status != coro::net::connect_status::connected)
        {
            COLONY_DEBUG("[{}] failed to connect to {} (status: {})",
                options_.name,
                options_.url,
                static_cast<int>(connection_status));
            co_return error::CONNECTION_ERROR();
        }

        auto tcp = std::make_shared<tcp_stream>(std::move(client));

        // upgrade request
        std::string key = generate_ws_key();
        std::string request = build_upgrade_request(target, key);
        std::span<const char> unsent{request};
        while (!unsent.empty())
        {
            auto status = co_await tcp->poll(coro::poll_op::write, remaining_until(deadline));
            if (status != coro::poll_status::event || std::chrono::steady_clock::now() >= deadline)
            {
                COLONY_ERROR("[{}] unable to send the websocket upgrade request", options_.name);
                co_return error::HANDSHAKE_FAILED();
            }
            auto [send_status, remaining] = tcp->send(unsent);
            if (send_status == coro::net::send_status::ok)
            {
                unsent = remaining;
            }
            else if (send_status != coro::net::send_status::would_block
                     && send_status != coro::net::send_status::try_again)
            {
                COLONY_ERROR("[{}] unable to send the websocket upgrade request", options_.name);
                co_return error::HANDSHAKE_FAILED();
            }
        }

        // upgrade response
        handshake_parser response(HTTP_RESPONSE);
        std::string buffer(handshake_chunk_size, '\0');
        bool complete = false;
        while (!complete)
        {
            if (closed_ || std::chrono::steady_clock::now() >= deadline)
            {
                COLONY_ERROR("[{}] no websocket upgrade response from {}", options_.name, options_.url);
                co_return error::HANDSHAKE_FAILED();
            }

            auto status
                = co_await tcp->poll(coro::poll_op::read, std::min(remaining_until(deadline), sleep_slice));
            if (status == coro::poll_status::timeout)
                continue;
            if (status == coro::poll_status::error)
            {
                COLONY_ERROR("[{}] socket error during websocket upgrade", options_.name);
                co_return error::HANDSHAKE_FAILED();
            }

            auto [recv_status, recv_span] = tcp->recv(buffer);
            if (recv_status == coro::net::recv_status::ok && !recv_span.empty())
            {
                auto parse = response.feed(recv_span);
                if (parse == parse_status::error)
                {
                    COLONY_ERROR("[{}] malformed websocket upgrade response: {}", options_.name, response.error_reason());
                    co_return error::HANDSHAKE_FAILED();
                }
                complete = parse == parse_status::complete;
            }
            else if (recv_status != coro::net::recv_status::try_again
                     && recv_status != coro::net::recv_status::would_block)
            {
                COLONY_ERROR("[{}] connection closed during websocket upgrade", options_.name);
                co_return error::HANDSHAKE_FAILED();
            }
        }

        err = validate_upgrade_response(response, key);
        if (err != error::OK())
            co_return err;

        std::shared_ptr<websocket_connection> connection;
        try
        {
            connection = std::make_shared<websocket_connection>(
                tcp, connection_role::client, response.leftover(), options_.connection);
        }
        catch (const std::exception& ex)
        {
            COLONY_ERROR("[{}] {}", options_.name, ex.what());
            co_return error::TRANSPORT_ERROR();
        }

        {
            std::scoped_lock lock(connection_mutex_);
            connection_ = std::move(connection);
        }
        COLONY_INFO("[{}] connected to {}", options_.name, options_.url);
        co_return error::OK();
    }

    coro::task<void> transport_session::run()
    {
        if (loop_active_.exchange(true))
        {
            COLONY_ERROR("[{}] run() is already active", options_.name);
            co_return;
        }
        run_started_ = true;
        if (!closed_)
            running_ = true;

        uint32_t failures = 0;
        while (running_)
        {
            set_state(connection_state::connecting);
            int err = co_await connect();

            std::shared_ptr<websocket_connection> connection;
            {
                std::scoped_lock lock(connection_mutex_);
                connection = connection_;
            }

            if (err == error::OK() && connection)
            {
                failures = 0;
                if (!running_)
                {
                    // close() arrived while the handshake was in flight
                    connection->close();
                }
                set_state(connection_state::connected);

                err = co_await connection->run(
                    [this](std::string frame)
                    {
                        if (frame_handler_)
                            frame_handler_(std::move(frame));
                    });

                {
                    std::scoped_lock lock(connection_mutex_);
                    connection_.reset();
                }
                if (running_)
                {
                    COLONY_WARNING("[{}] connection to {} lost ({})", options_.name, options_.url, error::to_string(err));
                }
            }
            else
            {
                ++failures;
                COLONY_WARNING("[{}] unable to connect to {}: {}", options_.name, options_.url, error::to_string(err));
            }

            set_state(connection_state::disconnected);
            if (!running_)
                break;

            auto delay = options_.reconnect.next_delay(std::max<uint32_t>(failures, 1));
            COLONY_INFO("[{}] reconnecting in {} ms", options_.name, delay.count());
            co_await sleep_while_running(delay);
        }

        set_state(connection_state::closed);
        loop_active_ = false;
        stopped_.set();
        co_return;
    }

    coro::task<void> transport_session::run_and_release(std::shared_ptr<transport_session> self)
    {
        co_await self->run();
        co_return;
    }

    bool transport_session::start()
    {
        run_started_ = true;
        return scheduler_->spawn(run_and_release(shared_from_this()));
    }

    coro::task<void> transport_session::sleep_while_running(std::chrono::milliseconds delay)
    {
        auto deadline = std::chrono::steady_clock::now() + delay;
        while (running_ && std::chrono::steady_clock::now() < deadline)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            co_await scheduler_->yield_for(std::clamp(left, std::chrono::milliseconds{1}, sleep_slice));
        }
        co_return;
    }

    int transport_session::send(std::string frame)
    {
        if (state_ != connection_state::connected)
            return error::CONNECTION_ERROR();

        std::scoped_lock lock(connection_mutex_);
        if (!connection_)
            return error::CONNECTION_ERROR();
        return connection_->send_text(std::move(frame));
    }

    void transport_session::drop_connection()
    {
        std::scoped_lock lock(connection_mutex_);
        if (connection_)
            connection_->abort();
    }

    coro::task<void> transport_session::close()
    {
        closed_ = true;
        running_ = false;
        {
            std::scoped_lock lock(connection_mutex_);
            if (connection_)
                connection_->close();
        }

        if (run_started_)
        {
            co_await stopped_;
        }
        else
        {
            set_state(connection_state::closed);
        }
        co_return;
    }
}
