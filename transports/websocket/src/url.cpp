/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

#include <charconv>

#include <fmt/format.h>

#include <colony/error_codes.h>
#include <colony/logging.h>
#include <transports/websocket/url.h>

namespace colony::websocket
{
    namespace
    {
        constexpr std::string_view ws_scheme = "ws://";
    }

    std::string endpoint::host_header() const
    {
        if (port == 80)
            return host;
        return fmt::format("{}:{}", host, port);
    }

    int parse_ws_url(std::string_view url, endpoint& out)
    {
        if (url.size() <= ws_scheme.size() || url.substr(0, ws_scheme.size()) != ws_scheme)
        {
            COLONY_ERROR("unsupported url '{}', expected ws://host[:port][/path]", url);
            return error::INVALID_URL();
        }

        auto rest = url.substr(ws_scheme.size());
        auto path_pos = rest.find('/');
        auto authority = rest.substr(0, path_pos);
        std::string path = path_pos == std::string_view::npos ? std::string("/") : std::string(rest.substr(path_pos));

        if (authority.empty())
        {
            COLONY_ERROR("url '{}' has no host", url);
            return error::INVALID_URL();
        }

        std::string_view host = authority;
        uint16_t port = 80;
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos)
        {
            host = authority.substr(0, colon);
            auto port_text = authority.substr(colon + 1);
            unsigned int value = 0;
            auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), value);
            if (ec != std::errc() || ptr != port_text.data() + port_text.size() || value == 0 || value > 65535)
            {
                COLONY_ERROR("url '{}' has an invalid port", url);
                return error::INVALID_URL();
            }
            port = static_cast<uint16_t>(value);
        }

        if (host.empty())
        {
            COLONY_ERROR("url '{}' has no host", url);
            return error::INVALID_URL();
        }

        out.host = std::string(host);
        out.port = port;
        out.path = std::move(path);
        return error::OK();
    }

    int resolve_ipv4(const std::string& host, std::string& address)
    {
        if (host == "localhost")
        {
            address = "127.0.0.1";
            return error::OK();
        }

        in_addr parsed{};
        if (inet_pton(AF_INET, host.c_str(), &parsed) == 1)
        {
            address = host;
            return error::OK();
        }

        addrinfo hints{};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* results = nullptr;
        int ret = getaddrinfo(host.c_str(), nullptr, &hints, &results);
        if (ret != 0 || results == nullptr)
        {
            COLONY_ERROR("unable to resolve host '{}': {}", host, gai_strerror(ret));
            return error::INVALID_URL();
        }

        char buffer[INET_ADDRSTRLEN] = {};
        auto* ipv4 = reinterpret_cast<sockaddr_in*>(results->ai_addr);
        inet_ntop(AF_INET, &ipv4->sin_addr, buffer, sizeof(buffer));
        freeaddrinfo(results);

        address = buffer;
        return error::OK();
    }
}
