//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_SHARED_READ_BUFFER_H
#define PGWIRE_SHARED_READ_BUFFER_H

#include "../cancellation/cancellation_token.h"
#include "../types/task.h"

#include <cstddef>
#include <cstdint>
#include <span>

namespace pgwire {

/// The connection's receive buffer as seen by the readers that share it.
///
/// There is exactly one read cursor. Every reader, one after the other,
/// consumes from that cursor, so a reader that stops early must skip what
/// it did not consume before the next one starts.
class shared_read_buffer {
public:
    virtual ~shared_read_buffer() = default;

    /// Index of the next unread byte.
    [[nodiscard]] virtual auto read_position() const noexcept -> std::int32_t = 0;

    /// Move the cursor over bytes already in the buffer.
    ///
    /// \throw std::out_of_range
    /// If \p position is negative or past the filled part of the buffer.
    virtual auto set_read_position(std::int32_t position) -> void = 0;

    /// Bytes in the buffer that have not been consumed yet.
    [[nodiscard]] virtual auto read_bytes_left() const noexcept -> std::int32_t = 0;

    /// Copy up to buffer.size() bytes, filling from the connection (blocking)
    /// only if nothing is buffered. May return fewer bytes than requested.
    virtual auto read(std::span<std::byte> buffer) -> std::size_t = 0;

    /// Asynchronous read(); suspends only while filling from the connection.
    virtual auto read_async(std::span<std::byte> buffer, cancellation_token ct) -> task<std::size_t> = 0;

    /// Discard \p count bytes, filling from the connection as needed. With
    /// async = false the returned task completes without suspending.
    virtual auto skip(std::int32_t count, bool async) -> task<> = 0;
};

}

#endif //PGWIRE_SHARED_READ_BUFFER_H
