/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>
#include <random>

#include <transports/websocket/reconnect_policy.h>

namespace colony::websocket
{
    std::chrono::milliseconds reconnect_policy::next_delay(uint32_t attempt) const
    {
        std::chrono::milliseconds delay = base_delay;
        if (kind == backoff_kind::exponential && attempt > 1)
        {
            // stop doubling once the cap is reached
            for (uint32_t i = 1; i < attempt && delay < max_delay; ++i)
            {
                delay *= 2;
            }
            delay = std::min(delay, max_delay);
        }

        if (jitter.count() > 0)
        {
            thread_local std::mt19937_64 generator{std::random_device{}()};
            std::uniform_int_distribution<int64_t> distribution(0, jitter.count());
            delay += std::chrono::milliseconds(distribution(generator));
        }
        return delay;
    }

    reconnect_policy reconnect_policy::constant_delay(std::chrono::milliseconds delay)
    {
        return reconnect_policy{.kind = backoff_kind::constant, .base_delay = delay, .max_delay = delay};
    }

    reconnect_policy reconnect_policy::exponential_backoff(
        std::chrono::milliseconds base, std::chrono::milliseconds max, std::chrono::milliseconds jitter)
    {
        return reconnect_policy{.kind = backoff_kind::exponential, .base_delay = base, .max_delay = max, .jitter = jitter};
    }
}
