//
// Created by Jesson on 2026/10/18.
//

#include "../../include/pgwire/io/memory_byte_source.h"
#include "../../include/pgwire/cancellation/cancellation_registration.h"

#include <algorithm>
#include <cstring>
#include <utility>

pgwire::memory_byte_source::memory_byte_source(std::vector<std::byte> data, std::size_t max_chunk)
    : m_data(std::move(data))
    , m_offset(0)
    , m_max_chunk(max_chunk == 0 ? 1 : max_chunk)
    , m_read_calls(0)
    , m_released(true) {}

auto pgwire::memory_byte_source::read_some(std::span<std::byte> buffer, bool async, cancellation_token ct)
    -> task<std::size_t> {
    ++m_read_calls;
    if (async) {
        ct.throw_if_cancellation_requested();
        if (!m_released.is_set()) {
            // A cancelled wait lifts the hold for every waiter.
            cancellation_registration registration(ct, [this] { m_released.set(); });
            co_await m_released;
        }
        ct.throw_if_cancellation_requested();
    }
    co_return deliver(buffer);
}

void pgwire::memory_byte_source::append(std::span<const std::byte> bytes) {
    m_data.insert(m_data.end(), bytes.begin(), bytes.end());
}

auto pgwire::memory_byte_source::deliver(std::span<std::byte> buffer) noexcept -> std::size_t {
    const auto count = std::min({ buffer.size(), m_max_chunk, bytes_remaining() });
    if (count > 0) {
        std::memcpy(buffer.data(), m_data.data() + m_offset, count);
        m_offset += count;
    }
    return count;
}
