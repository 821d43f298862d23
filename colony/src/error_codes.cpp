/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <fmt/format.h>

#include <colony/error_codes.h>

namespace colony::error
{
    std::string to_string(int err)
    {
        switch (err)
        {
        case OK():
            return "OK";
        case CONNECTION_ERROR():
            return "CONNECTION_ERROR";
        case TIMED_OUT():
            return "TIMED_OUT";
        case CALL_CANCELLED():
            return "CALL_CANCELLED";
        case PROTOCOL_ERROR():
            return "PROTOCOL_ERROR";
        case TRANSPORT_ERROR():
            return "TRANSPORT_ERROR";
        case INVALID_URL():
            return "INVALID_URL";
        case HANDSHAKE_FAILED():
            return "HANDSHAKE_FAILED";
        case INVALID_DATA():
            return "INVALID_DATA";
        default:
            return fmt::format("UNKNOWN_ERROR({})", err);
        }
    }
}
