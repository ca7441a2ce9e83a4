//
// Created by Jesson on 2026/10/18.
//

#include "../../include/pgwire/io/read_buffer.h"
#include "../../include/pgwire/detail/sync_wait.h"
#include "../../include/pgwire/errors.h"

#include <glog/logging.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

pgwire::read_buffer::read_buffer(byte_source& source, std::int32_t size)
    : m_source(source)
    , m_size(size)
    , m_read_position(0)
    , m_filled_bytes(0)
    , m_discarded_bytes(0) {
    if (size <= 0 || size > max_size) {
        throw std::invalid_argument("read_buffer size must be in [1, " + std::to_string(max_size) + "], got " + std::to_string(size));
    }
    m_buffer = std::make_unique<std::byte[]>(static_cast<std::size_t>(size));
}

auto pgwire::read_buffer::set_read_position(std::int32_t position) -> void {
    if (position < 0 || position > m_filled_bytes) {
        throw std::out_of_range(
            "read position " + std::to_string(position) + " is outside the filled buffer [0, " +
            std::to_string(m_filled_bytes) + "]");
    }
    m_read_position = position;
}

auto pgwire::read_buffer::read(std::span<std::byte> buffer) -> std::size_t {
    return sync_wait(read_core(buffer, false, {}));
}

auto pgwire::read_buffer::read_async(std::span<std::byte> buffer, cancellation_token ct) -> task<std::size_t> {
    return read_core(buffer, true, std::move(ct));
}

auto pgwire::read_buffer::skip(std::int32_t count, bool async) -> task<> {
    if (count < 0) {
        throw std::invalid_argument("skip count must be non-negative, got " + std::to_string(count));
    }

    while (true) {
        const auto left = read_bytes_left();
        if (count <= left) {
            m_read_position += count;
            co_return;
        }
        count -= left;
        m_read_position = m_filled_bytes;
        co_await fill(std::min(count, m_size), async, {});
    }
}

auto pgwire::read_buffer::ensure(std::int32_t count, bool async, cancellation_token ct) -> task<> {
    if (count < 0 || count > m_size) {
        throw std::invalid_argument(
            "cannot ensure " + std::to_string(count) + " bytes in a buffer of " + std::to_string(m_size));
    }
    if (read_bytes_left() >= count) {
        co_return;
    }
    co_await fill(count, async, ct);
}

auto pgwire::read_buffer::read_core(std::span<std::byte> buffer, bool async, cancellation_token ct)
    -> task<std::size_t> {
    if (buffer.empty()) {
        co_return 0;
    }
    if (read_bytes_left() > 0) {
        co_return copy_out(buffer);
    }

    if (buffer.size() >= static_cast<std::size_t>(m_size)) {
        // Nothing buffered and the caller wants at least a buffer's worth:
        // receive straight into the caller's memory.
        discard_consumed();
        const auto received = co_await m_source.read_some(buffer, async, ct);
        if (received == 0) {
            throw end_of_stream{};
        }
        m_discarded_bytes += static_cast<std::int64_t>(received);
        co_return received;
    }

    co_await fill(1, async, ct);
    co_return copy_out(buffer);
}

auto pgwire::read_buffer::fill(std::int32_t count, bool async, cancellation_token ct) -> task<> {
    if (m_read_position + count > m_size) {
        discard_consumed();
    }

    while (read_bytes_left() < count) {
        std::span<std::byte> free_space{
            m_buffer.get() + m_filled_bytes, static_cast<std::size_t>(m_size - m_filled_bytes) };
        const auto received = co_await m_source.read_some(free_space, async, ct);
        if (received == 0) {
            LOG(ERROR) << "connection closed with " << count - read_bytes_left() << " bytes still expected";
            throw end_of_stream{};
        }
        m_filled_bytes += static_cast<std::int32_t>(received);
        VLOG(2) << "filled " << received << " bytes, " << read_bytes_left() << " unread";
    }
}

auto pgwire::read_buffer::copy_out(std::span<std::byte> buffer) noexcept -> std::size_t {
    const auto count = std::min(buffer.size(), static_cast<std::size_t>(read_bytes_left()));
    std::memcpy(buffer.data(), m_buffer.get() + m_read_position, count);
    m_read_position += static_cast<std::int32_t>(count);
    return count;
}

auto pgwire::read_buffer::discard_consumed() noexcept -> void {
    const auto left = read_bytes_left();
    if (left > 0 && m_read_position > 0) {
        std::memmove(m_buffer.get(), m_buffer.get() + m_read_position, static_cast<std::size_t>(left));
    }
    m_discarded_bytes += m_read_position;
    m_filled_bytes = left;
    m_read_position = 0;
}
