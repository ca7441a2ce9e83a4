//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_MEMORY_BYTE_SOURCE_H
#define PGWIRE_MEMORY_BYTE_SOURCE_H

#include "byte_source.h"
#include "../awaitable/async_manual_reset_event.h"

#include <cstddef>
#include <limits>
#include <span>
#include <vector>

namespace pgwire {

/// A byte_source over bytes held in memory.
///
/// \p max_chunk limits how many bytes a single read_some() hands out, which
/// reproduces the partial deliveries of a real socket. While hold() is in
/// effect asynchronous reads suspend until release() or until their token
/// is cancelled; synchronous reads are not affected.
class memory_byte_source final : public byte_source {
public:
    explicit memory_byte_source(
        std::vector<std::byte> data,
        std::size_t max_chunk = std::numeric_limits<std::size_t>::max());

    auto read_some(std::span<std::byte> buffer, bool async, cancellation_token ct)
        -> task<std::size_t> override;

    /// Append bytes that subsequent reads will deliver.
    void append(std::span<const std::byte> bytes);

    void hold() noexcept { m_released.reset(); }
    void release() noexcept { m_released.set(); }

    auto bytes_remaining() const noexcept -> std::size_t { return m_data.size() - m_offset; }
    auto read_calls() const noexcept -> std::size_t { return m_read_calls; }

private:
    auto deliver(std::span<std::byte> buffer) noexcept -> std::size_t;

    std::vector<std::byte> m_data;
    std::size_t m_offset;
    std::size_t m_max_chunk;
    std::size_t m_read_calls;
    async_manual_reset_event m_released;
};

}

#endif //PGWIRE_MEMORY_BYTE_SOURCE_H
