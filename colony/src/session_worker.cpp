/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <colony/logging.h>
#include <colony/session_worker.h>

namespace colony
{
    session_worker::session_worker(options opts)
        : options_(std::move(opts))
        , inbound_(options_.inbound_capacity, overflow_policy::drop_newest)
        , results_(options_.inbound_capacity, overflow_policy::drop_newest)
        , outbound_(options_.outbound_capacity, overflow_policy::drop_oldest)
    {
    }

    session_worker::~session_worker()
    {
        stop();
    }

    bool session_worker::start()
    {
        if (running_.exchange(true))
            return false;
        stop_requested_ = false;
        thread_ = std::thread([this]() { thread_main(); });
        return true;
    }

    void session_worker::stop()
    {
        stop_requested_ = true;
        if (thread_.joinable())
        {
            thread_.join();
        }
        running_ = false;
    }

    uint64_t session_worker::post(request_action action)
    {
        if (!running_ || stop_requested_)
            return 0;

        if (unanswered_.fetch_add(1) >= results_.capacity())
        {
            --unanswered_;
            COLONY_WARNING("session worker has too many unpolled results, command dropped");
            return 0;
        }

        auto id = next_id_++;
        if (!inbound_.push(posted_command{id, std::move(action)}))
        {
            --unanswered_;
            COLONY_WARNING("session worker command queue full, command dropped");
            return 0;
        }
        return id;
    }

    std::optional<worker_message> session_worker::poll()
    {
        if (auto result = results_.try_pop())
        {
            --unanswered_;
            return worker_message{std::move(*result)};
        }
        {
            std::scoped_lock lock(status_mutex_);
            if (pending_status_)
            {
                worker_message message{*pending_status_};
                pending_status_.reset();
                return message;
            }
        }
        return outbound_.try_pop();
    }

    void session_worker::push_result(command_result result)
    {
        // cannot overflow, post() caps the unanswered count at the queue capacity
        if (!results_.push(std::move(result)))
        {
            COLONY_ERROR("session worker result queue overflowed");
        }
    }

    void session_worker::thread_main()
    {
        auto scheduler = coro::io_scheduler::make_shared(
            coro::io_scheduler::options{.thread_strategy = coro::io_scheduler::thread_strategy_t::manual,
                .execution_strategy = coro::io_scheduler::execution_strategy_t::process_tasks_inline});

        client_ = std::make_unique<client>(scheduler, options_.client);

        bool finished = false;
        auto wrapper = [this, scheduler, &finished]() -> coro::task<void>
        {
            co_await main_loop(scheduler);
            finished = true;
            co_return;
        };

        if (!scheduler->spawn(wrapper()))
        {
            COLONY_ERROR("session worker unable to start its main loop");
            client_.reset();
            return;
        }

        while (!finished)
        {
            scheduler->process_events(std::chrono::milliseconds(1));
        }

        // let detached tasks that were resumed during shutdown run to completion
        for (int i = 0; i < 10; ++i)
        {
            scheduler->process_events(std::chrono::milliseconds(1));
        }

        client_.reset();
        scheduler->shutdown();
    }

    coro::task<void> session_worker::main_loop(std::shared_ptr<coro::io_scheduler> scheduler)
    {
        co_await scheduler->schedule();

        if (!client_->connect())
        {
            COLONY_ERROR("session worker unable to connect the client");
        }

        ++active_tasks_;
        if (!scheduler->spawn(pump_events()))
        {
            COLONY_ERROR("session worker unable to start the event pump");
            --active_tasks_;
        }

        while (!stop_requested_)
        {
            while (auto command = inbound_.try_pop())
            {
                ++active_tasks_;
                if (!scheduler->spawn(run_command(std::move(*command))))
                {
                    --active_tasks_;
                }
            }
            report_status();
            co_await scheduler->yield_for(options_.command_poll_interval);
        }

        co_await client_->disconnect();
        report_status();

        while (active_tasks_ > 0)
        {
            co_await scheduler->yield_for(std::chrono::milliseconds{1});
        }

        // commands posted after the loop stopped still get an answer
        while (auto command = inbound_.try_pop())
        {
            push_result(command_result{command->id, error::CALL_CANCELLED(), nullptr});
        }
        co_return;
    }

    coro::task<void> session_worker::pump_events()
    {
        while (!stop_requested_)
        {
            auto ev = co_await client_->get_events(options_.event_wait);
            if (!ev)
                continue;

            std::optional<state_update> update;
            if (ev->type == options_.state_event_type)
            {
                try
                {
                    update = state_update{ev->payload.get<colony_state>()};
                }
                catch (const nlohmann::json::exception& ex)
                {
                    COLONY_WARNING("{} event could not be decoded: {}", options_.state_event_type, ex.what());
                }
            }

            outbound_.push(std::move(*ev));
            if (update)
                outbound_.push(std::move(*update));
        }
        --active_tasks_;
        co_return;
    }

    coro::task<void> session_worker::run_command(posted_command command)
    {
        nlohmann::json response;
        int err = co_await client_->send_request(command.action, response);
        if (err != error::OK())
        {
            COLONY_DEBUG("command {} ({}) failed: {}", command.id, action_name(command.action), error::to_string(err));
            response = nullptr;
        }
        push_result(command_result{command.id, err, std::move(response)});
        --active_tasks_;
        co_return;
    }

    void session_worker::report_status()
    {
        connection_status status{client_->command_state(), client_->event_state()};
        if (last_status_ && last_status_->command == status.command && last_status_->events == status.events)
            return;
        last_status_ = status;
        std::scoped_lock lock(status_mutex_);
        pending_status_ = status;
    }
}
