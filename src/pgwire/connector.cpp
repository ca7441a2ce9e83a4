//
// Created by Jesson on 2026/10/18.
//

#include "../../include/pgwire/connector.h"
#include "../../include/pgwire/detail/sync_wait.h"
#include "../../include/pgwire/errors.h"
#include "../../include/pgwire/io/socket_byte_source.h"

#include <glog/logging.h>

#include <stdexcept>
#include <string>
#include <utility>

pgwire::connector::connector(std::unique_ptr<byte_source> source, const connection_options& options)
    : m_options(options)
    , m_source(std::move(source))
    , m_read_buffer(*m_source, options.read_buffer_size)
    , m_column_stream(*this, m_read_buffer, options.start_cancellable_operations)
    , m_cancellable_depth(0)
    , m_closed(false) {}

auto pgwire::connector::over_socket(int fd, const connection_options& options) -> std::unique_ptr<connector> {
    return std::make_unique<connector>(
        std::make_unique<socket_byte_source>(fd, options.socket_poll_interval), options);
}

auto pgwire::connector::open_column_stream(std::int32_t length, bool seekable) -> column_stream& {
    check_open();
    check_column_length(length, seekable);

    if (!m_column_stream.is_disposed()) {
        LOG(WARNING) << "previous column stream was not disposed, skipping its unread bytes";
        m_column_stream.dispose();
    }
    if (seekable) {
        sync_wait(m_read_buffer.ensure(length, false));
    }

    VLOG(1) << "opening column stream: length=" << length << " seekable=" << seekable;
    m_column_stream.init(length, seekable);
    return m_column_stream;
}

auto pgwire::connector::open_column_stream_async(std::int32_t length, bool seekable, cancellation_token ct)
    -> task<column_stream&> {
    check_open();
    check_column_length(length, seekable);

    if (!m_column_stream.is_disposed()) {
        LOG(WARNING) << "previous column stream was not disposed, skipping its unread bytes";
        co_await m_column_stream.dispose_async();
    }
    if (seekable) {
        co_await m_read_buffer.ensure(length, true, std::move(ct));
    }

    VLOG(1) << "opening column stream: length=" << length << " seekable=" << seekable;
    m_column_stream.init(length, seekable);
    co_return m_column_stream;
}

auto pgwire::connector::start_nested_cancellable_operation(cancellation_token ct, bool attempt_protocol_cancel)
    -> cancellable_operation_scope {
    return cancellable_operation_scope(*this, std::move(ct), attempt_protocol_cancel);
}

void pgwire::connector::set_protocol_cancel_handler(std::function<void()> handler) {
    std::lock_guard lock(m_cancellation_mutex);
    m_protocol_cancel_handler = std::move(handler);
}

auto pgwire::connector::user_cancellation_token() const -> cancellation_token {
    std::lock_guard lock(m_cancellation_mutex);
    return m_user_cancellation.token();
}

bool pgwire::connector::user_cancellation_requested() const {
    std::lock_guard lock(m_cancellation_mutex);
    return m_user_cancellation.is_cancellation_requested();
}

bool pgwire::connector::is_in_cancellable_operation() const noexcept {
    return m_cancellable_depth.load(std::memory_order_acquire) > 0;
}

void pgwire::connector::close() {
    if (m_closed) {
        return;
    }
    m_column_stream.dispose();
    m_closed = true;
    VLOG(1) << "connector closed";
}

void pgwire::connector::enter_cancellable_operation() {
    if (m_cancellable_depth.fetch_add(1, std::memory_order_acq_rel) == 0) {
        // Outermost operation: start a fresh cancellation cycle.
        std::lock_guard lock(m_cancellation_mutex);
        m_user_cancellation = cancellation_source{};
    }
}

void pgwire::connector::exit_cancellable_operation() noexcept {
    m_cancellable_depth.fetch_sub(1, std::memory_order_acq_rel);
}

void pgwire::connector::perform_user_cancellation(bool attempt_protocol_cancel) {
    cancellation_source source;
    std::function<void()> handler;
    {
        std::lock_guard lock(m_cancellation_mutex);
        source = m_user_cancellation;
        if (attempt_protocol_cancel) {
            handler = m_protocol_cancel_handler;
        }
    }

    LOG(WARNING) << "user cancellation requested"
                 << (attempt_protocol_cancel ? ", attempting protocol cancellation" : "");
    source.request_cancellation();
    if (handler) {
        handler();
    }
}

void pgwire::connector::check_open() const {
    if (m_closed) {
        throw object_disposed("connector");
    }
}

void pgwire::connector::check_column_length(std::int32_t length, bool seekable) const {
    if (length < 0) {
        throw std::invalid_argument("column length must be non-negative, got " + std::to_string(length));
    }
    if (seekable && length > m_read_buffer.size()) {
        throw std::invalid_argument(
            "a seekable column must fit in the read buffer (" + std::to_string(m_read_buffer.size()) +
            " bytes), got " + std::to_string(length));
    }
}
