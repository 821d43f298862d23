/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <cstdint>

namespace colony
{
    namespace websocket
    {
        enum class backoff_kind
        {
            constant,
            exponential
        };

        /**
         * @brief Delay between reconnect attempts of a transport_session
         *
         * constant waits base_delay after every failure. exponential doubles base_delay per
         * consecutive failure, capped at max_delay. jitter adds a uniformly random extra delay
         * in [0, jitter] to either kind.
         */
        struct reconnect_policy
        {
            backoff_kind kind = backoff_kind::constant;
            std::chrono::milliseconds base_delay{5000};
            std::chrono::milliseconds max_delay{60000};
            std::chrono::milliseconds jitter{0};

            // attempt counts consecutive failures and starts at 1
            std::chrono::milliseconds next_delay(uint32_t attempt) const;

            static reconnect_policy constant_delay(std::chrono::milliseconds delay);
            static reconnect_policy exponential_backoff(std::chrono::milliseconds base,
                std::chrono::milliseconds max,
                std::chrono::milliseconds jitter = std::chrono::milliseconds{0});
        };
    }
}
