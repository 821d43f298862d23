/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>
#include <cctype>

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <fmt/format.h>

#include <colony/error_codes.h>
#include <colony/logging.h>
#include <transports/websocket/handshake.h>

namespace colony::websocket
{
    namespace
    {
        constexpr std::string_view websocket_guid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

        std::string base64_encode(const unsigned char* data, size_t length)
        {
            BIO* b64 = BIO_new(BIO_f_base64());
            BIO* bio = BIO_new(BIO_s_mem());
            bio = BIO_push(b64, bio);

            BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
            BIO_write(bio, data, static_cast<int>(length));
            BIO_flush(bio);

            BUF_MEM* buffer = nullptr;
            BIO_get_mem_ptr(bio, &buffer);
            std::string result(buffer->data, buffer->length);
            BIO_free_all(bio);
            return result;
        }

        std::string to_lower(std::string_view text)
        {
            std::string result(text);
            std::transform(result.begin(),
                result.end(),
                result.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        bool contains_token(std::string_view value, std::string_view token)
        {
            return to_lower(value).find(to_lower(token)) != std::string::npos;
        }
    }

    std::string calculate_ws_accept(std::string_view client_key)
    {
        std::string combined = std::string(client_key) + std::string(websocket_guid);

        unsigned char hash[SHA_DIGEST_LENGTH];
        SHA1(reinterpret_cast<const unsigned char*>(combined.c_str()), combined.size(), hash);
        return base64_encode(hash, SHA_DIGEST_LENGTH);
    }

    std::string generate_ws_key()
    {
        unsigned char nonce[16];
        if (RAND_bytes(nonce, sizeof(nonce)) != 1)
        {
            // RAND_bytes only fails when the generator is unseeded
            COLONY_WARNING("RAND_bytes failed generating a websocket key");
        }
        return base64_encode(nonce, sizeof(nonce));
    }

    std::string build_upgrade_request(const endpoint& target, std::string_view key)
    {
        return fmt::format("GET {} HTTP/1.1\r\n"
                           "Host: {}\r\n"
                           "Upgrade: websocket\r\n"
                           "Connection: Upgrade\r\n"
                           "Sec-WebSocket-Key: {}\r\n"
                           "Sec-WebSocket-Version: 13\r\n"
                           "\r\n",
            target.path,
            target.host_header(),
            key);
    }

    std::string build_http_response(
        int status_code, std::string_view status_text, const std::map<std::string, std::string>& headers)
    {
        std::string response = fmt::format("HTTP/1.1 {} {}\r\n", status_code, status_text);
        for (const auto& [key, value] : headers)
        {
            response += fmt::format("{}: {}\r\n", key, value);
        }
        if (status_code != 101 && headers.find("Content-Length") == headers.end())
        {
            response += "Content-Length: 0\r\n";
        }
        response += "\r\n";
        return response;
    }

    std::string build_upgrade_response(std::string_view accept_key)
    {
        return build_http_response(101,
            "Switching Protocols",
            {{"Upgrade", "websocket"}, {"Connection", "Upgrade"}, {"Sec-WebSocket-Accept", std::string(accept_key)}});
    }

    handshake_parser::handshake_parser(llhttp_type_t type)
    {
        llhttp_settings_init(&settings_);
        settings_.on_url = on_url;
        settings_.on_header_field = on_header_field;
        settings_.on_header_value = on_header_value;
        settings_.on_headers_complete = on_headers_complete;
        settings_.on_message_complete = on_message_complete;

        llhttp_init(&parser_, type, &settings_);
        parser_.data = this;
    }

    parse_status handshake_parser::feed(std::span<const char> data)
    {
        if (message_complete_ && upgrade_)
        {
            // already upgraded, anything further is websocket traffic
            leftover_.append(data.begin(), data.end());
            return parse_status::complete;
        }

        llhttp_errno_t err = llhttp_execute(&parser_, data.data(), data.size());
        if (err == HPE_PAUSED_UPGRADE)
        {
            upgrade_ = true;
            const char* stop = llhttp_get_error_pos(&parser_);
            if (stop != nullptr && stop >= data.data() && stop < data.data() + data.size())
            {
                leftover_.assign(stop, data.data() + data.size());
            }
            status_code_ = parser_.status_code;
            return parse_status::complete;
        }
        if (err != HPE_OK)
        {
            error_reason_ = fmt::format("{}: {}", llhttp_errno_name(err), llhttp_get_error_reason(&parser_));
            return parse_status::error;
        }

        status_code_ = parser_.status_code;
        if (message_complete_)
        {
            // a complete message without an upgrade is a refusal
            return parse_status::complete;
        }
        return parse_status::incomplete;
    }

    std::string handshake_parser::header(std::string_view name) const
    {
        auto it = headers_.find(to_lower(name));
        if (it == headers_.end())
            return {};
        return it->second;
    }

    void handshake_parser::store_header()
    {
        if (!current_field_.empty())
        {
            headers_[to_lower(current_field_)] = current_value_;
        }
        current_field_.clear();
        current_value_.clear();
        in_value_ = false;
    }

    int handshake_parser::on_url(llhttp_t* parser, const char* at, size_t length)
    {
        auto* self = static_cast<handshake_parser*>(parser->data);
        self->url_.append(at, length);
        return 0;
    }

    int handshake_parser::on_header_field(llhttp_t* parser, const char* at, size_t length)
    {
        auto* self = static_cast<handshake_parser*>(parser->data);
        // llhttp may split a field across calls, a new field only starts after a value
        if (self->in_value_)
        {
            self->store_header();
        }
        self->current_field_.append(at, length);
        return 0;
    }

    int handshake_parser::on_header_value(llhttp_t* parser, const char* at, size_t length)
    {
        auto* self = static_cast<handshake_parser*>(parser->data);
        self->in_value_ = true;
        self->current_value_.append(at, length);
        return 0;
    }

    int handshake_parser::on_headers_complete(llhttp_t* parser)
    {
        auto* self = static_cast<handshake_parser*>(parser->data);
        self->store_header();
        self->headers_complete_ = true;
        return 0;
    }

    int handshake_parser::on_message_complete(llhttp_t* parser)
    {
        auto* self = static_cast<handshake_parser*>(parser->data);
        self->message_complete_ = true;
        return 0;
    }

    int validate_upgrade_response(const handshake_parser& response, std::string_view key)
    {
        if (response.status_code() != 101 || !response.is_upgrade())
        {
            COLONY_ERROR("websocket upgrade refused with status {}", response.status_code());
            return error::HANDSHAKE_FAILED();
        }
        if (!contains_token(response.header("Upgrade"), "websocket"))
        {
            COLONY_ERROR("websocket upgrade response has no 'Upgrade: websocket' header");
            return error::HANDSHAKE_FAILED();
        }
        auto expected = calculate_ws_accept(key);
        if (response.header("Sec-WebSocket-Accept") != expected)
        {
            COLONY_ERROR("websocket upgrade response carries an incorrect Sec-WebSocket-Accept");
            return error::HANDSHAKE_FAILED();
        }
        return error::OK();
    }
}
