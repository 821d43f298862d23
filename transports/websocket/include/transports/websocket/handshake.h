/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <map>
#include <span>
#include <string>
#include <string_view>

#include <llhttp.h>

#include <transports/websocket/url.h>

namespace colony
{
    namespace websocket
    {
        // Sec-WebSocket-Accept value for a Sec-WebSocket-Key (RFC 6455 section 4.2.2)
        std::string calculate_ws_accept(std::string_view client_key);

        // 16 random bytes, base64 encoded
        std::string generate_ws_key();

        std::string build_upgrade_request(const endpoint& target, std::string_view key);

        std::string build_http_response(
            int status_code, std::string_view status_text, const std::map<std::string, std::string>& headers);

        std::string build_upgrade_response(std::string_view accept_key);

        enum class parse_status
        {
            incomplete,
            complete,
            error
        };

        /**
         * @brief Incremental parser for the HTTP half of the WebSocket opening handshake
         *
         * Wraps llhttp. Feed it raw bytes as they arrive; once it reports complete the
         * headers are available and leftover() holds any bytes that followed the header
         * block, which belong to the WebSocket stream.
         *
         * Header names are stored lower case.
         */
        class handshake_parser
        {
        public:
            explicit handshake_parser(llhttp_type_t type);

            handshake_parser(const handshake_parser&) = delete;
            handshake_parser& operator=(const handshake_parser&) = delete;

            parse_status feed(std::span<const char> data);

            bool is_upgrade() const { return upgrade_; }
            int status_code() const { return status_code_; }
            const std::string& url() const { return url_; }
            const std::string& leftover() const { return leftover_; }
            const std::string& error_reason() const { return error_reason_; }

            // empty if absent
            std::string header(std::string_view name) const;

        private:
            static int on_url(llhttp_t* parser, const char* at, size_t length);
            static int on_header_field(llhttp_t* parser, const char* at, size_t length);
            static int on_header_value(llhttp_t* parser, const char* at, size_t length);
            static int on_headers_complete(llhttp_t* parser);
            static int on_message_complete(llhttp_t* parser);

            void store_header();

            llhttp_t parser_;
            llhttp_settings_t settings_;

            std::map<std::string, std::string> headers_;
            std::string current_field_;
            std::string current_value_;
            bool in_value_ = false;

            std::string url_;
            std::string leftover_;
            std::string error_reason_;
            int status_code_ = 0;
            bool headers_complete_ = false;
            bool message_complete_ = false;
            bool upgrade_ = false;
        };

        // Checks status 101, the Upgrade header and Sec-WebSocket-Accept against the key we sent
        int validate_upgrade_response(const handshake_parser& response, std::string_view key);
    }
}
