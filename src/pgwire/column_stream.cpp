//
// Created by Jesson on 2026/10/18.
//

#include "../../include/pgwire/column_stream.h"
#include "../../include/pgwire/cancellable_operation_scope.h"
#include "../../include/pgwire/connector.h"
#include "../../include/pgwire/detail/sync_wait.h"
#include "../../include/pgwire/errors.h"

#include <glog/logging.h>

#include <algorithm>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

auto completed(std::size_t value) -> pgwire::task<std::size_t> {
    co_return value;
}

auto completed_or_cancelled(pgwire::cancellation_token ct) -> pgwire::task<> {
    ct.throw_if_cancellation_requested();
    co_return;
}

void validate_region(const std::byte* buffer, std::size_t buffer_size, int offset, int count) {
    if (buffer == nullptr) {
        throw std::invalid_argument("buffer must not be null");
    }
    if (offset < 0) {
        throw std::invalid_argument("offset must be non-negative, got " + std::to_string(offset));
    }
    if (count < 0) {
        throw std::invalid_argument("count must be non-negative, got " + std::to_string(count));
    }
    if (static_cast<std::size_t>(offset) > buffer_size ||
        buffer_size - static_cast<std::size_t>(offset) < static_cast<std::size_t>(count)) {
        throw std::invalid_argument(
            "Offset and length were out of bounds for the array or count is greater than the number of "
            "elements from index to the end of the source collection.");
    }
}

}

pgwire::column_stream::column_stream(connector& owner, bool start_cancellable_operations)
    : column_stream(owner, owner.read_buffer(), start_cancellable_operations) {}

pgwire::column_stream::column_stream(connector& owner, shared_read_buffer& buffer, bool start_cancellable_operations)
    : m_connector(owner)
    , m_buffer(buffer)
    , m_start_cancellable_operations(start_cancellable_operations) {}

void pgwire::column_stream::init(std::int32_t length, bool can_seek) {
    if (length < 0) {
        throw std::invalid_argument("column length must be non-negative, got " + std::to_string(length));
    }
    DCHECK(!can_seek || m_buffer.read_bytes_left() >= length)
        << "Seekable stream constructed but not all data is in buffer (sequential)";

    m_start = m_buffer.read_position();
    m_len = length;
    m_read = 0;
    m_can_seek = can_seek;
    m_is_disposed = false;
    VLOG(1) << "column stream init: start=" << m_start << " length=" << m_len << " seekable=" << m_can_seek;
}

auto pgwire::column_stream::length() const -> std::int64_t {
    check_disposed();
    return m_len;
}

void pgwire::column_stream::set_length(std::int64_t) {
    throw not_supported("column_stream does not support set_length");
}

auto pgwire::column_stream::position() const -> std::int64_t {
    check_disposed();
    return m_read;
}

void pgwire::column_stream::set_position(std::int64_t value) {
    if (value < 0) {
        throw std::out_of_range("Non-negative number required.");
    }
    seek(value, seek_origin::begin);
}

auto pgwire::column_stream::seek(std::int64_t offset, seek_origin origin) -> std::int64_t {
    check_disposed();

    if (!m_can_seek) {
        throw not_supported("column_stream is not seekable");
    }
    if (offset > std::numeric_limits<std::int32_t>::max() || offset < std::numeric_limits<std::int32_t>::min()) {
        throw std::out_of_range("Stream length must be non-negative and less than 2^31 - 1 - origin.");
    }

    std::int64_t new_read = 0;
    switch (origin) {
    case seek_origin::begin:
        if (offset < 0) {
            throw seek_before_begin{};
        }
        new_read = offset;
        break;
    case seek_origin::current:
        new_read = static_cast<std::int64_t>(m_read) + offset;
        break;
    case seek_origin::end:
        new_read = static_cast<std::int64_t>(m_len) + offset;
        break;
    default:
        throw std::invalid_argument("Invalid seek origin.");
    }

    if (new_read < 0) {
        throw seek_before_begin{};
    }
    if (m_start + new_read > std::numeric_limits<std::int32_t>::max()) {
        throw std::out_of_range("seek target exceeds the buffer's 32-bit position range");
    }

    // Past the end only the cursor moves; the buffer stays at the end of the column.
    m_buffer.set_read_position(m_start + static_cast<std::int32_t>(std::min<std::int64_t>(new_read, m_len)));
    m_read = static_cast<std::int32_t>(new_read);
    return m_read;
}

void pgwire::column_stream::flush() const {
    check_disposed();
}

auto pgwire::column_stream::flush_async(cancellation_token ct) const -> task<> {
    check_disposed();
    return completed_or_cancelled(std::move(ct));
}

auto pgwire::column_stream::read_byte() -> int {
    std::byte value{};
    const auto read = this->read(std::span<std::byte>(&value, 1));
    return read > 0 ? std::to_integer<int>(value) : -1;
}

auto pgwire::column_stream::read(std::span<std::byte> buffer) -> std::size_t {
    check_disposed();

    const auto count = bounded_count(buffer.size());
    if (count == 0) {
        return 0;
    }

    const auto read = m_buffer.read(buffer.first(count));
    m_read += static_cast<std::int32_t>(read);
    return read;
}

auto pgwire::column_stream::read(std::byte* buffer, std::size_t buffer_size, int offset, int count) -> std::size_t {
    validate_region(buffer, buffer_size, offset, count);
    return read(std::span<std::byte>(buffer + offset, static_cast<std::size_t>(count)));
}

auto pgwire::column_stream::read_async(std::span<std::byte> buffer, cancellation_token ct) -> task<std::size_t> {
    check_disposed();

    const auto count = bounded_count(buffer.size());
    if (count == 0) {
        return completed(0);
    }
    return read_long(buffer.first(count), std::move(ct));
}

auto pgwire::column_stream::read_async(
    std::byte* buffer, std::size_t buffer_size, int offset, int count, cancellation_token ct) -> task<std::size_t> {
    validate_region(buffer, buffer_size, offset, count);
    return read_async(std::span<std::byte>(buffer + offset, static_cast<std::size_t>(count)), std::move(ct));
}

void pgwire::column_stream::write(std::span<const std::byte>) {
    throw not_supported("column_stream is read-only");
}

void pgwire::column_stream::dispose() {
    sync_wait(dispose_core(false));
}

auto pgwire::column_stream::dispose_async() -> task<> {
    return dispose_core(true);
}

auto pgwire::column_stream::dispose_core(bool async) -> task<> {
    if (m_is_disposed) {
        co_return;
    }

    const auto left_to_skip = m_len - m_read;
    if (left_to_skip > 0) {
        try {
            co_await m_buffer.skip(left_to_skip, async);
        }
        catch (const std::exception& e) {
            LOG(ERROR) << "failed to skip " << left_to_skip << " unread bytes of column: " << e.what();
            throw;
        }
    }

    m_is_disposed = true;
    VLOG(1) << "column stream disposed: length=" << m_len << " skipped=" << std::max(left_to_skip, 0);
}

auto pgwire::column_stream::read_long(std::span<std::byte> buffer, cancellation_token ct) -> task<std::size_t> {
    std::optional<cancellable_operation_scope> scope;
    if (m_start_cancellable_operations) {
        scope.emplace(m_connector.start_nested_cancellable_operation(ct, false));
    }

    const auto read = co_await m_buffer.read_async(buffer, std::move(ct));
    m_read += static_cast<std::int32_t>(read);
    co_return read;
}

auto pgwire::column_stream::bounded_count(std::size_t requested) const noexcept -> std::size_t {
    const auto remaining = std::max(m_len - m_read, 0);
    return std::min(requested, static_cast<std::size_t>(remaining));
}

void pgwire::column_stream::check_disposed() const {
    if (m_is_disposed) {
        throw object_disposed("column_stream");
    }
}
