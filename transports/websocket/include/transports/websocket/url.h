/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace colony
{
    namespace websocket
    {
        struct endpoint
        {
            std::string host;
            uint16_t port = 80;
            std::string path = "/";

            // value for the Host header, port omitted when it is the default
            std::string host_header() const;
        };

        // Parses ws://host[:port][/path]. Only plain ws is accepted.
        // Returns colony::error::INVALID_URL() on anything else.
        int parse_ws_url(std::string_view url, endpoint& out);

        // Resolves a host name to a dotted IPv4 address, "localhost" maps to 127.0.0.1
        int resolve_ipv4(const std::string& host, std::string& address);
    }
}
