/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>

namespace colony
{
    /**
     * @brief Integer error codes returned by every fallible colony operation
     *
     * Codes live in a private range so they never collide with errno values
     * surfaced by the socket layer. OK() is always zero.
     *
     * Request-level codes (CONNECTION_ERROR, TIMED_OUT, CALL_CANCELLED, INVALID_DATA)
     * reach callers of command_channel::send_request and the client facade.
     * PROTOCOL_ERROR and TRANSPORT_ERROR are absorbed inside the channels and only
     * ever appear in logs or as the return value of transport level calls.
     */
    namespace error
    {
        inline constexpr int OK() { return 0; }
        inline constexpr int MIN() { return 31000; }
        inline constexpr int CONNECTION_ERROR() { return 31001; }
        inline constexpr int TIMED_OUT() { return 31002; }
        inline constexpr int CALL_CANCELLED() { return 31003; }
        inline constexpr int PROTOCOL_ERROR() { return 31004; }
        inline constexpr int TRANSPORT_ERROR() { return 31005; }
        inline constexpr int INVALID_URL() { return 31006; }
        inline constexpr int HANDSHAKE_FAILED() { return 31007; }
        inline constexpr int INVALID_DATA() { return 31008; }
        inline constexpr int MAX() { return 31008; }

        std::string to_string(int err);
    }
}
