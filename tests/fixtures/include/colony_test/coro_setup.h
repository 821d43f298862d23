/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include <coro/coro.hpp>
#include <gtest/gtest.h>

#define CORO_ASSERT_EQ(x, y)                                                                                           \
    do                                                                                                                 \
    {                                                                                                                  \
        auto _coro_temp_x = (x);                                                                                       \
        auto _coro_temp_y = (y);                                                                                       \
        EXPECT_EQ(_coro_temp_x, _coro_temp_y);                                                                         \
        if (!(_coro_temp_x == _coro_temp_y))                                                                           \
        {                                                                                                              \
            co_return false;                                                                                           \
        }                                                                                                              \
    } while (0)

#define CORO_ASSERT_NE(x, y)                                                                                           \
    do                                                                                                                 \
    {                                                                                                                  \
        auto _coro_temp_x = (x);                                                                                       \
        auto _coro_temp_y = (y);                                                                                       \
        EXPECT_NE(_coro_temp_x, _coro_temp_y);                                                                         \
        if (_coro_temp_x == _coro_temp_y)                                                                              \
        {                                                                                                              \
            co_return false;                                                                                           \
        }                                                                                                              \
    } while (0)

#define CORO_ASSERT_TRUE(x)                                                                                            \
    do                                                                                                                 \
    {                                                                                                                  \
        bool _coro_temp = static_cast<bool>(x);                                                                        \
        EXPECT_TRUE(_coro_temp) << #x;                                                                                 \
        if (!_coro_temp)                                                                                               \
        {                                                                                                              \
            co_return false;                                                                                           \
        }                                                                                                              \
    } while (0)

#define CORO_ASSERT_FALSE(x) CORO_ASSERT_TRUE(!(x))

namespace colony_test
{
    // Ports are handed out per process so parallel test processes rarely collide
    inline uint16_t allocate_port()
    {
        static std::atomic<uint16_t> next_port{static_cast<uint16_t>(20000 + (getpid() % 1500) * 20)};
        return next_port++;
    }

    /**
     * @brief Single threaded scheduler driven by the test thread
     *
     * The scheduler uses the manual thread strategy and runs tasks inline, so everything a
     * test starts (client sessions, mock servers, watchdogs) interleaves deterministically
     * on the thread that calls process_events().
     */
    class coro_setup
    {
        std::shared_ptr<coro::io_scheduler> io_scheduler_;
        bool error_has_occurred_ = false;

    public:
        std::shared_ptr<coro::io_scheduler> get_scheduler() const { return io_scheduler_; }
        bool error_has_occurred() const { return error_has_occurred_; }

        coro::task<void> check_for_error(coro::task<bool> task)
        {
            auto ret = co_await task;
            if (!ret)
            {
                error_has_occurred_ = true;
            }
            co_return;
        }

        void set_up()
        {
            error_has_occurred_ = false;
            io_scheduler_ = coro::io_scheduler::make_shared(
                coro::io_scheduler::options{.thread_strategy = coro::io_scheduler::thread_strategy_t::manual,
                    .execution_strategy = coro::io_scheduler::execution_strategy_t::process_tasks_inline});
        }

        void tear_down()
        {
            // let tasks that were told to stop reach their exit
            for (int i = 0; i < 100; ++i)
            {
                io_scheduler_->process_events(std::chrono::milliseconds(1));
            }
            io_scheduler_->shutdown();
            io_scheduler_.reset();
        }

        // Drives the scheduler until pred holds or limit passes
        template<class Pred> bool pump_until(Pred pred, std::chrono::milliseconds limit)
        {
            auto deadline = std::chrono::steady_clock::now() + limit;
            while (!pred())
            {
                if (std::chrono::steady_clock::now() >= deadline)
                    return false;
                io_scheduler_->process_events(std::chrono::milliseconds(1));
            }
            return true;
        }
    };

    template<class T> class type_test : public testing::Test
    {
        T lib_;

    public:
        T& get_lib() { return lib_; }
        const T& get_lib() const { return lib_; }

        void SetUp() override { this->lib_.set_up(); }
        void TearDown() override { this->lib_.tear_down(); }
    };

    using coro_test = type_test<coro_setup>;

    // Runs a coroutine returning bool on the fixture's scheduler until it completes
    template<typename TestFixture, typename CoroFunc>
    void run_coro_test(TestFixture& test_fixture,
        CoroFunc&& coro_function,
        std::chrono::milliseconds limit = std::chrono::milliseconds(30000))
    {
        auto& lib = test_fixture.get_lib();
        bool is_ready = false;
        auto wrapper_function = [&]() -> coro::task<bool>
        {
            auto result = co_await coro_function(lib);
            is_ready = true;
            co_return result;
        };

        ASSERT_TRUE(lib.get_scheduler()->spawn(lib.check_for_error(wrapper_function())));

        ASSERT_TRUE(lib.pump_until([&] { return is_ready; }, limit)) << "test coroutine did not finish in time";
        ASSERT_EQ(lib.error_has_occurred(), false);
    }

    // Suspends until pred holds, false if limit passes first
    template<class Pred>
    coro::task<bool> wait_for(std::shared_ptr<coro::io_scheduler> scheduler,
        Pred pred,
        std::chrono::milliseconds limit = std::chrono::milliseconds(5000))
    {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (!pred())
        {
            if (std::chrono::steady_clock::now() >= deadline)
                co_return false;
            co_await scheduler->yield_for(std::chrono::milliseconds(1));
        }
        co_return true;
    }
}
