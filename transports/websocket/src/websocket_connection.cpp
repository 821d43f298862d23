/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>
#include <cstring>
#include <stdexcept>

#include <openssl/rand.h>

#include <colony/error_codes.h>
#include <colony/logging.h>
#include <transports/websocket/websocket_connection.h>

namespace colony::websocket
{
    namespace
    {
        constexpr size_t read_chunk_size = 8192;
    }

    websocket_connection::websocket_connection(
        std::shared_ptr<stream> stream, connection_role role, std::string initial_bytes, connection_options options)
        : stream_(std::move(stream))
        , role_(role)
        , options_(options)
        , read_buffer_(std::move(initial_bytes))
    {
        wslay_event_callbacks callbacks;
        std::memset(&callbacks, 0, sizeof(callbacks));
        callbacks.recv_callback = recv_callback;
        callbacks.send_callback = send_callback;
        callbacks.on_msg_recv_callback = on_msg_recv_callback;

        int result = 0;
        if (role_ == connection_role::client)
        {
            callbacks.genmask_callback = genmask_callback;
            result = wslay_event_context_client_init(&wslay_ctx_, &callbacks, this);
        }
        else
        {
            result = wslay_event_context_server_init(&wslay_ctx_, &callbacks, this);
        }
        if (result != 0)
        {
            throw std::runtime_error("Failed to initialize wslay context");
        }
        wslay_event_config_set_max_recv_msg_length(wslay_ctx_, options_.max_message_length);
    }

    websocket_connection::~websocket_connection()
    {
        if (wslay_ctx_ != nullptr)
        {
            wslay_event_context_free(wslay_ctx_);
            wslay_ctx_ = nullptr;
        }
    }

    int websocket_connection::send_text(std::string message)
    {
        if (!is_open())
        {
            return error::CONNECTION_ERROR();
        }
        std::scoped_lock lock(outbox_mutex_);
        outbox_.push_back(std::move(message));
        return error::OK();
    }

    void websocket_connection::close(uint16_t status_code)
    {
        close_code_ = status_code;
        close_requested_ = true;
    }

    void websocket_connection::abort()
    {
        abort_requested_ = true;
        close_requested_ = true;
        stream_->shutdown();
    }

    void websocket_connection::drain_outbox()
    {
        std::deque<std::string> pending;
        {
            std::scoped_lock lock(outbox_mutex_);
            pending.swap(outbox_);
        }
        if (pending.empty())
            return;

        std::scoped_lock lock(wslay_mutex_);
        for (auto& message : pending)
        {
            wslay_event_msg msg;
            msg.opcode = WSLAY_TEXT_FRAME;
            msg.msg = reinterpret_cast<const uint8_t*>(message.data());
            msg.msg_length = message.size();

            int result = wslay_event_queue_msg(wslay_ctx_, &msg);
            if (result != 0)
            {
                COLONY_ERROR("failed to queue websocket message: {}", result);
            }
        }
    }

    int websocket_connection::feed_wslay()
    {
        std::scoped_lock lock(wslay_mutex_);
        int r = wslay_event_recv(wslay_ctx_);
        if (r != 0)
        {
            COLONY_ERROR("wslay_event_recv error: {}", r);
            return error::TRANSPORT_ERROR();
        }
        return error::OK();
    }

    void websocket_connection::dispatch(const message_handler& handler)
    {
        std::vector<std::string> messages;
        {
            std::scoped_lock lock(wslay_mutex_);
            messages.swap(received_);
        }
        for (auto& message : messages)
        {
            if (handler)
                handler(std::move(message));
        }
    }

    coro::task<int> websocket_connection::run(message_handler handler)
    {
        int result = error::OK();
        std::string buffer(read_chunk_size, '\0');

        // bytes that arrived with the upgrade response
        if (!read_buffer_.empty())
        {
            result = feed_wslay();
            dispatch(handler);
        }

        while (result == error::OK())
        {
            if (abort_requested_)
            {
                COLONY_DEBUG("websocket connection aborted");
                break;
            }

            drain_outbox();

            if (close_requested_ && !close_queued_)
            {
                std::scoped_lock lock(wslay_mutex_);
                wslay_event_queue_close(wslay_ctx_, close_code_, nullptr, 0);
                close_queued_ = true;
                close_deadline_ = std::chrono::steady_clock::now() + options_.close_grace;
            }

            bool want_read, want_write;
            {
                std::scoped_lock lock(wslay_mutex_);
                want_read = wslay_event_want_read(wslay_ctx_) != 0;
                want_write = wslay_event_want_write(wslay_ctx_) != 0;
            }

            if (!want_read && !want_write)
            {
                COLONY_DEBUG("websocket connection closed normally");
                break;
            }

            if (close_queued_ && std::chrono::steady_clock::now() >= close_deadline_)
            {
                COLONY_WARNING("peer did not answer the websocket close frame in time");
                break;
            }

            if (want_write)
            {
                auto status = co_await stream_->poll(coro::poll_op::write, options_.poll_interval);
                if (status == coro::poll_status::event)
                {
                    std::scoped_lock lock(wslay_mutex_);
                    int r = wslay_event_send(wslay_ctx_);
                    if (r != 0)
                    {
                        COLONY_ERROR("wslay_event_send error: {}", r);
                        result = error::TRANSPORT_ERROR();
                        break;
                    }
                }
                else if (status != coro::poll_status::timeout)
                {
                    COLONY_DEBUG("websocket write poll failed status = {}", static_cast<int>(status));
                    result = error::TRANSPORT_ERROR();
                    break;
                }
            }

            if (want_read)
            {
                auto status = co_await stream_->poll(coro::poll_op::read, options_.poll_interval);
                if (status == coro::poll_status::timeout)
                {
                    continue;
                }
                if (status == coro::poll_status::error)
                {
                    COLONY_DEBUG("websocket read poll failed");
                    result = error::TRANSPORT_ERROR();
                    break;
                }

                // event or closed: drain whatever is still buffered before giving up
                auto [recv_status, recv_span] = stream_->recv(buffer);
                if (recv_status == coro::net::recv_status::ok && !recv_span.empty())
                {
                    read_buffer_.assign(recv_span.begin(), recv_span.end());
                    read_buffer_pos_ = 0;
                    result = feed_wslay();
                    dispatch(handler);
                }
                else if (recv_status == coro::net::recv_status::try_again
                         || recv_status == coro::net::recv_status::would_block)
                {
                    if (status == coro::poll_status::closed)
                    {
                        result = error::TRANSPORT_ERROR();
                    }
                }
                else
                {
                    COLONY_DEBUG("websocket peer disconnected");
                    stream_->set_closed();
                    // a dropped socket after our close frame still counts as an orderly close
                    if (!close_queued_)
                        result = error::TRANSPORT_ERROR();
                    break;
                }
            }
        }

        open_ = false;
        stream_->shutdown();
        dispatch(handler);
        {
            std::scoped_lock lock(outbox_mutex_);
            outbox_.clear();
        }
        co_return result;
    }

    ssize_t websocket_connection::send_callback(
        wslay_event_context_ptr ctx, const uint8_t* data, size_t len, int flags, void* user_data)
    {
        auto* self = static_cast<websocket_connection*>(user_data);

        if (self->stream_->is_closed())
        {
            wslay_event_set_error(ctx, WSLAY_ERR_CALLBACK_FAILURE);
            return -1;
        }

        auto [status, remaining] = self->stream_->send(std::span<const char>(reinterpret_cast<const char*>(data), len));

        if (status == coro::net::send_status::ok)
        {
            return static_cast<ssize_t>(len - remaining.size());
        }
        else if (status == coro::net::send_status::would_block || status == coro::net::send_status::try_again)
        {
            wslay_event_set_error(ctx, WSLAY_ERR_WOULDBLOCK);
            return -1;
        }
        else
        {
            self->stream_->set_closed();
            wslay_event_set_error(ctx, WSLAY_ERR_CALLBACK_FAILURE);
            return -1;
        }
    }

    ssize_t websocket_connection::recv_callback(
        wslay_event_context_ptr ctx, uint8_t* buf, size_t len, int flags, void* user_data)
    {
        auto* self = static_cast<websocket_connection*>(user_data);

        if (self->read_buffer_pos_ < self->read_buffer_.size())
        {
            size_t available = self->read_buffer_.size() - self->read_buffer_pos_;
            size_t to_copy = std::min(len, available);
            std::memcpy(buf, self->read_buffer_.data() + self->read_buffer_pos_, to_copy);
            self->read_buffer_pos_ += to_copy;
            return static_cast<ssize_t>(to_copy);
        }

        wslay_event_set_error(ctx, WSLAY_ERR_WOULDBLOCK);
        return -1;
    }

    int websocket_connection::genmask_callback(wslay_event_context_ptr ctx, uint8_t* buf, size_t len, void* user_data)
    {
        if (RAND_bytes(buf, static_cast<int>(len)) != 1)
        {
            wslay_event_set_error(ctx, WSLAY_ERR_CALLBACK_FAILURE);
            return -1;
        }
        return 0;
    }

    void websocket_connection::on_msg_recv_callback(
        wslay_event_context_ptr ctx, const wslay_event_on_msg_recv_arg* arg, void* user_data)
    {
        auto* self = static_cast<websocket_connection*>(user_data);

        if (!wslay_is_ctrl_frame(arg->opcode))
        {
            if (arg->opcode == WSLAY_TEXT_FRAME)
            {
                self->received_.emplace_back(reinterpret_cast<const char*>(arg->msg), arg->msg_length);
            }
            else
            {
                COLONY_WARNING("dropping binary websocket message ({} bytes)", arg->msg_length);
            }
        }
        else if (arg->opcode == WSLAY_CONNECTION_CLOSE)
        {
            COLONY_DEBUG("websocket close received, status code: {}", arg->status_code);
        }
    }
}
