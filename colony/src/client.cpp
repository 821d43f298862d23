/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <colony/client.h>
#include <colony/logging.h>

namespace colony
{
    namespace
    {
        coro::task<void> stop_channel(std::shared_ptr<command_channel> channel)
        {
            co_await channel->stop();
            co_return;
        }

        // a missing or non boolean "success" counts as failure
        bool read_success(const nlohmann::json& response)
        {
            auto it = response.find("success");
            return it != response.end() && it->is_boolean() && it->get<bool>();
        }

        const nlohmann::json& read_payload(const nlohmann::json& response)
        {
            static const nlohmann::json empty = nlohmann::json::object();
            auto it = response.find("payload");
            if (it == response.end() || it->is_null())
                return empty;
            return *it;
        }
    }

    client::client(std::shared_ptr<coro::io_scheduler> scheduler, client_options options)
        : scheduler_(std::move(scheduler))
        , options_(std::move(options))
    {
    }

    client::~client()
    {
        if (started_)
        {
            COLONY_WARNING("client destroyed without disconnect()");
        }
    }

    bool client::connect()
    {
        if (started_)
            return true;
        if (stopping_)
        {
            COLONY_WARNING("connect() called while the client is disconnecting");
            return false;
        }

        websocket::session_options command_options{.name = "command",
            .url = options_.command_url,
            .connect_timeout = options_.connect_timeout,
            .reconnect = options_.reconnect};
        websocket::session_options event_options{.name = "event",
            .url = options_.event_url,
            .connect_timeout = options_.connect_timeout,
            .reconnect = options_.reconnect};

        command_ = command_channel::create(websocket::transport_session::create(scheduler_, command_options),
            command_channel_options{.default_timeout = options_.request_timeout});
        events_ = event_channel::create(websocket::transport_session::create(scheduler_, event_options), options_.events);

        if (!command_->start())
        {
            COLONY_ERROR("unable to schedule the command session");
            return false;
        }
        if (!events_->start())
        {
            COLONY_ERROR("unable to schedule the event session");
            if (!scheduler_->spawn(stop_channel(command_)))
            {
                COLONY_ERROR("unable to stop the command session");
            }
            return false;
        }
        started_ = true;
        COLONY_INFO("client connecting, commands {} events {}", options_.command_url, options_.event_url);
        return true;
    }

    coro::task<void> client::disconnect()
    {
        if (stopping_)
        {
            co_await stopped_;
            co_return;
        }
        if (!started_)
            co_return;
        started_ = false;
        stopping_ = true;
        stopped_.reset();

        co_await command_->stop();
        co_await events_->stop();
        stopping_ = false;
        COLONY_INFO("client disconnected");
        stopped_.set();
        co_return;
    }

    coro::task<bool> client::wait_until_connected(std::chrono::milliseconds timeout)
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!is_connected())
        {
            if (!started_ || std::chrono::steady_clock::now() >= deadline)
                co_return false;
            co_await scheduler_->yield_for(std::chrono::milliseconds{5});
        }
        co_return true;
    }

    bool client::is_connected() const
    {
        return command_state() == websocket::connection_state::connected
               && event_state() == websocket::connection_state::connected;
    }

    websocket::connection_state client::command_state() const
    {
        if (!command_)
            return websocket::connection_state::disconnected;
        return command_->get_state();
    }

    websocket::connection_state client::event_state() const
    {
        if (!events_)
            return websocket::connection_state::disconnected;
        return events_->get_state();
    }

    coro::task<int> client::send_request(const request_action& action, nlohmann::json& response)
    {
        if (!command_)
            co_return error::CONNECTION_ERROR();
        co_return co_await command_->send_request(action, response, options_.request_timeout);
    }

    coro::task<int> client::acknowledge(request_action action, bool& success)
    {
        success = false;
        nlohmann::json response;
        int err = co_await send_request(action, response);
        if (err != error::OK())
            co_return err;
        success = read_success(response);
        co_return error::OK();
    }

    coro::task<int> client::get_state(colony_state& state)
    {
        nlohmann::json response;
        int err = co_await send_request(actions::get_state{}, response);
        if (err != error::OK())
            co_return err;

        try
        {
            state = read_payload(response).get<colony_state>();
        }
        catch (const nlohmann::json::exception& ex)
        {
            COLONY_ERROR("unable to decode colony state: {}", ex.what());
            co_return error::INVALID_DATA();
        }
        co_return error::OK();
    }

    coro::task<int> client::build(std::string building_id, int x, int y, bool& success)
    {
        co_return co_await acknowledge(actions::build{std::move(building_id), cell{x, y}}, success);
    }

    coro::task<int> client::cancel_build(int x, int y, bool& success)
    {
        co_return co_await acknowledge(actions::cancel_build{cell{x, y}}, success);
    }

    coro::task<int> client::dig(int x, int y, bool& success)
    {
        co_return co_await acknowledge(actions::dig{cell{x, y}}, success);
    }

    coro::task<int> client::cancel_dig(int x, int y, bool& success)
    {
        co_return co_await acknowledge(actions::cancel_dig{cell{x, y}}, success);
    }

    coro::task<int> client::set_priority(int x, int y, int priority, bool& success)
    {
        co_return co_await acknowledge(actions::set_priority{cell{x, y}, priority}, success);
    }

    coro::task<int> client::set_speed(int speed, bool& success)
    {
        co_return co_await acknowledge(actions::set_speed{speed}, success);
    }

    coro::task<int> client::pause(bool& success)
    {
        co_return co_await set_speed(0, success);
    }

    coro::task<int> client::resume(bool& success)
    {
        co_return co_await set_speed(1, success);
    }

    coro::task<int> client::deploy_blueprint(nlohmann::json blueprint, bool& success)
    {
        co_return co_await acknowledge(actions::deploy_blueprint{std::move(blueprint)}, success);
    }

    coro::task<int> client::get_available_buildings(nlohmann::json& buildings)
    {
        nlohmann::json response;
        int err = co_await send_request(actions::get_buildings{}, response);
        if (err != error::OK())
            co_return err;

        const auto& payload = read_payload(response);
        if (!payload.is_object())
        {
            COLONY_ERROR("Info.GetBuildings payload is not an object");
            co_return error::INVALID_DATA();
        }
        auto it = payload.find("buildings");
        if (it == payload.end() || it->is_null())
        {
            buildings = nlohmann::json::array();
        }
        else if (!it->is_array())
        {
            COLONY_ERROR("Info.GetBuildings payload.buildings is not an array");
            co_return error::INVALID_DATA();
        }
        else
        {
            buildings = *it;
        }
        co_return error::OK();
    }

    coro::task<std::optional<event>> client::get_events(std::chrono::milliseconds timeout)
    {
        if (!events_)
            co_return std::nullopt;
        co_return co_await events_->get_event(timeout);
    }
}
