/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>

#include <colony/event_channel.h>
#include <colony/logging.h>

namespace colony
{
    std::shared_ptr<event_channel> event_channel::create(
        std::shared_ptr<websocket::transport_session> session, event_channel_options options)
    {
        auto channel = std::shared_ptr<event_channel>(new event_channel(std::move(session), options));
        std::weak_ptr<event_channel> weak = channel;
        channel->session_->set_frame_handler(
            [weak](std::string frame)
            {
                if (auto self = weak.lock())
                    self->on_frame(std::move(frame));
            });
        return channel;
    }

    event_channel::event_channel(std::shared_ptr<websocket::transport_session> session, event_channel_options options)
        : session_(std::move(session))
        , options_(options)
        , queue_(options.capacity, options.policy)
    {
    }

    bool event_channel::start()
    {
        return session_->start();
    }

    coro::task<void> event_channel::stop()
    {
        co_await session_->close();
        co_return;
    }

    coro::task<std::optional<event>> event_channel::get_event(std::chrono::milliseconds timeout)
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        auto scheduler = session_->get_scheduler();
        while (true)
        {
            auto next = queue_.try_pop();
            if (next)
                co_return next;

            auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
                co_return std::nullopt;

            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            co_await scheduler->yield_for(std::clamp(left, std::chrono::milliseconds{1}, options_.poll_interval));
        }
    }

    void event_channel::on_frame(std::string text)
    {
        auto frame = nlohmann::json::parse(text, nullptr, false);
        if (frame.is_discarded() || !frame.is_object())
        {
            COLONY_WARNING("[{}] dropping malformed event: {}", session_->get_options().name, text);
            return;
        }

        event ev;
        auto type = frame.find("type");
        if (type != frame.end())
        {
            if (!type->is_string())
            {
                COLONY_WARNING("[{}] dropping event with a non string type: {}", session_->get_options().name, text);
                return;
            }
            ev.type = type->get<std::string>();
        }
        auto payload = frame.find("payload");
        if (payload != frame.end())
            ev.payload = *payload;

        ev.frame = std::move(frame);
        ev.sequence = next_sequence_++;
        ev.received_at = std::chrono::system_clock::now();

        if (!queue_.push(std::move(ev)))
        {
            COLONY_WARNING("[{}] event queue full ({}), {} events dropped so far",
                session_->get_options().name,
                queue_.capacity(),
                queue_.dropped_count());
        }
    }
}
