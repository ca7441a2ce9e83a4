//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_READ_BUFFER_H
#define PGWIRE_READ_BUFFER_H

#include "byte_source.h"
#include "shared_read_buffer.h"

#include <cstdint>
#include <memory>

namespace pgwire {

/// Fixed-size receive buffer filled from a byte_source.
///
/// Consumed bytes are discarded (the unread tail is moved to the front)
/// only when a fill needs the room, so positions stay stable as long as
/// the bytes they refer to are resident.
class read_buffer final : public shared_read_buffer {
public:
    static constexpr std::int32_t default_size = 8192;
    static constexpr std::int32_t max_size = 1 << 30;

    /// \throw std::invalid_argument
    /// If \p size is not in [1, max_size].
    explicit read_buffer(byte_source& source, std::int32_t size = default_size);

    read_buffer(const read_buffer&) = delete;
    read_buffer& operator=(const read_buffer&) = delete;

    [[nodiscard]] auto read_position() const noexcept -> std::int32_t override { return m_read_position; }
    auto set_read_position(std::int32_t position) -> void override;
    [[nodiscard]] auto read_bytes_left() const noexcept -> std::int32_t override { return m_filled_bytes - m_read_position; }

    auto read(std::span<std::byte> buffer) -> std::size_t override;
    auto read_async(std::span<std::byte> buffer, cancellation_token ct) -> task<std::size_t> override;
    auto skip(std::int32_t count, bool async) -> task<> override;

    /// Make sure at least \p count unread bytes are resident.
    ///
    /// \throw std::invalid_argument
    /// If \p count is negative or larger than the buffer.
    /// \throw end_of_stream
    /// If the connection closes first.
    auto ensure(std::int32_t count, bool async, cancellation_token ct = {}) -> task<>;

    [[nodiscard]] auto size() const noexcept -> std::int32_t { return m_size; }
    [[nodiscard]] auto filled_bytes() const noexcept -> std::int32_t { return m_filled_bytes; }

    /// Bytes consumed since the buffer was created, across refills.
    [[nodiscard]] auto cumulative_read_position() const noexcept -> std::int64_t {
        return m_discarded_bytes + m_read_position;
    }

    /// Read-only view of the unread resident bytes.
    [[nodiscard]] auto unread() const noexcept -> std::span<const std::byte> {
        return { m_buffer.get() + m_read_position, static_cast<std::size_t>(read_bytes_left()) };
    }

private:
    auto read_core(std::span<std::byte> buffer, bool async, cancellation_token ct) -> task<std::size_t>;
    auto fill(std::int32_t count, bool async, cancellation_token ct) -> task<>;
    auto copy_out(std::span<std::byte> buffer) noexcept -> std::size_t;
    auto discard_consumed() noexcept -> void;

    byte_source& m_source;
    std::int32_t m_size;
    std::unique_ptr<std::byte[]> m_buffer;
    std::int32_t m_read_position;
    std::int32_t m_filled_bytes;
    std::int64_t m_discarded_bytes;
};

}

#endif //PGWIRE_READ_BUFFER_H
