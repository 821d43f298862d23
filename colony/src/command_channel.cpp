/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>
#include <random>

#include <openssl/rand.h>

#include <fmt/format.h>

#include <colony/command_channel.h>
#include <colony/logging.h>

namespace colony
{
    std::string generate_request_id()
    {
        unsigned char bytes[16];
        if (RAND_bytes(bytes, sizeof(bytes)) != 1)
        {
            COLONY_WARNING("RAND_bytes failed, falling back to std::random_device for request ids");
            std::random_device device;
            for (auto& b : bytes)
            {
                b = static_cast<unsigned char>(device());
            }
        }

        // version 4, variant 10xx
        bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

        return fmt::format("{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}",
            bytes[0],
            bytes[1],
            bytes[2],
            bytes[3],
            bytes[4],
            bytes[5],
            bytes[6],
            bytes[7],
            bytes[8],
            bytes[9],
            bytes[10],
            bytes[11],
            bytes[12],
            bytes[13],
            bytes[14],
            bytes[15]);
    }

    std::shared_ptr<command_channel> command_channel::create(
        std::shared_ptr<websocket::transport_session> session, command_channel_options options)
    {
        auto channel = std::shared_ptr<command_channel>(new command_channel(std::move(session), options));
        std::weak_ptr<command_channel> weak = channel;
        channel->session_->set_frame_handler(
            [weak](std::string frame)
            {
                if (auto self = weak.lock())
                    self->on_frame(std::move(frame));
            });
        channel->session_->add_state_observer(
            [weak](websocket::connection_state state)
            {
                if (auto self = weak.lock())
                    self->on_state(state);
            });
        return channel;
    }

    command_channel::command_channel(std::shared_ptr<websocket::transport_session> session, command_channel_options options)
        : session_(std::move(session))
        , options_(options)
    {
    }

    bool command_channel::start()
    {
        return session_->start();
    }

    coro::task<void> command_channel::stop()
    {
        co_await session_->close();

        auto cancelled = table_.fail_all(error::CALL_CANCELLED());
        if (cancelled)
        {
            COLONY_INFO("[{}] cancelled {} outstanding requests on shutdown", session_->get_options().name, cancelled);
        }

        // watchers notice their request resolved within one check interval
        auto scheduler = session_->get_scheduler();
        while (watchers_ > 0)
        {
            co_await scheduler->yield_for(options_.deadline_check_interval);
        }
        co_return;
    }

    coro::task<int> command_channel::send_request(
        std::string action, nlohmann::json payload, nlohmann::json& response, std::chrono::milliseconds timeout)
    {
        if (!session_->is_connected())
        {
            COLONY_WARNING("[{}] {} not sent, not connected", session_->get_options().name, action);
            co_return error::CONNECTION_ERROR();
        }

        auto deadline = std::chrono::steady_clock::now() + timeout;
        std::string id;
        std::shared_ptr<pending_request> request;
        while (!request)
        {
            id = generate_request_id();
            request = table_.insert(id, deadline);
        }

        nlohmann::json frame = {{"requestId", id}, {"action", action}, {"payload", std::move(payload)}};
        int err = session_->send(frame.dump());
        if (err != error::OK())
        {
            table_.fail(id, err);
            COLONY_WARNING("[{}] {} not sent: {}", session_->get_options().name, action, error::to_string(err));
            co_return error::CONNECTION_ERROR();
        }

        COLONY_DEBUG("[{}] sent {} id={}", session_->get_options().name, action, id);

        ++watchers_;
        if (!session_->get_scheduler()->spawn(watch_deadline(shared_from_this(), request)))
        {
            --watchers_;
            table_.fail(id, error::CALL_CANCELLED());
        }

        co_await request->resolved;

        if (request->error_code == error::OK())
        {
            response = std::move(request->response);
        }
        co_return request->error_code;
    }

    coro::task<int> command_channel::send_request(std::string action, nlohmann::json payload, nlohmann::json& response)
    {
        co_return co_await send_request(std::move(action), std::move(payload), response, options_.default_timeout);
    }

    coro::task<int> command_channel::send_request(
        const request_action& action, nlohmann::json& response, std::chrono::milliseconds timeout)
    {
        co_return co_await send_request(action_name(action), action_payload(action), response, timeout);
    }

    coro::task<int> command_channel::send_request(const request_action& action, nlohmann::json& response)
    {
        co_return co_await send_request(action_name(action), action_payload(action), response, options_.default_timeout);
    }

    coro::task<void> command_channel::watch_deadline(
        std::shared_ptr<command_channel> self, std::shared_ptr<pending_request> request)
    {
        auto scheduler = self->session_->get_scheduler();
        while (!request->resolved.is_set())
        {
            auto now = std::chrono::steady_clock::now();
            if (now >= request->deadline)
            {
                if (self->table_.fail(request->id, error::TIMED_OUT()))
                {
                    COLONY_WARNING("[{}] request {} timed out", self->session_->get_options().name, request->id);
                }
                break;
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(request->deadline - now);
            co_await scheduler->yield_for(
                std::clamp(left, std::chrono::milliseconds{1}, self->options_.deadline_check_interval));
        }
        --self->watchers_;
        co_return;
    }

    void command_channel::on_frame(std::string text)
    {
        auto frame = nlohmann::json::parse(text, nullptr, false);
        if (frame.is_discarded() || !frame.is_object())
        {
            COLONY_WARNING("[{}] dropping malformed frame: {}", session_->get_options().name, text);
            return;
        }

        auto it = frame.find("requestId");
        if (it == frame.end() || !it->is_string())
        {
            COLONY_WARNING("[{}] dropping frame without a requestId: {}", session_->get_options().name, text);
            return;
        }

        std::string id = it->get<std::string>();
        if (!table_.resolve(id, std::move(frame)))
        {
            COLONY_WARNING("[{}] received response for unknown request {}", session_->get_options().name, id);
        }
    }

    void command_channel::on_state(websocket::connection_state state)
    {
        if (state != websocket::connection_state::disconnected && state != websocket::connection_state::closed)
            return;

        auto cancelled = table_.fail_all(error::CALL_CANCELLED());
        if (cancelled)
        {
            COLONY_WARNING("[{}] connection lost, cancelled {} outstanding requests",
                session_->get_options().name,
                cancelled);
        }
    }
}
