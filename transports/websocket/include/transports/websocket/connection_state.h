/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string_view>

namespace colony
{
    namespace websocket
    {
        /**
         * @brief Lifecycle of a transport_session
         *
         * disconnected -> connecting -> connected -> disconnected -> ... while running.
         * closed is terminal and only reached through transport_session::close().
         */
        enum class connection_state
        {
            disconnected,
            connecting,
            connected,
            closed
        };

        inline std::string_view to_string(connection_state state)
        {
            switch (state)
            {
            case connection_state::disconnected:
                return "disconnected";
            case connection_state::connecting:
                return "connecting";
            case connection_state::connected:
                return "connected";
            case connection_state::closed:
                return "closed";
            }
            return "unknown";
        }
    }
}
