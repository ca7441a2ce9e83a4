//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_COLUMN_STREAM_H
#define PGWIRE_COLUMN_STREAM_H

#include "cancellation/cancellation_token.h"
#include "io/shared_read_buffer.h"
#include "types/task.h"

#include <cstddef>
#include <cstdint>
#include <span>

namespace pgwire {

class connector;

enum class seek_origin {
    begin,
    current,
    end
};

/// A read-only stream over the bytes of one column value, read in place
/// from the connection's shared read buffer.
///
/// The stream is a window (start, length, cursor) over the buffer's read
/// cursor and never copies the value. A connector owns one instance and
/// init()s it again for every column it hands out. Disposing the stream
/// skips whatever the consumer did not read, so the buffer is positioned at
/// the end of the column no matter how much of it was consumed.
///
/// A stream is seekable only if the whole value was resident in the buffer
/// when it was initialized; seeking then never performs I/O.
///
/// Not thread-safe: one consumer at a time.
class column_stream {
public:
    explicit column_stream(connector& owner, bool start_cancellable_operations = true);
    column_stream(connector& owner, shared_read_buffer& buffer, bool start_cancellable_operations = true);

    column_stream(const column_stream&) = delete;
    column_stream& operator=(const column_stream&) = delete;

    /// Activate the stream over the next \p length bytes of the buffer.
    ///
    /// \param can_seek
    /// The caller guarantees that all \p length bytes are already buffered.
    ///
    /// \throw std::invalid_argument
    /// If \p length is negative.
    void init(std::int32_t length, bool can_seek);

    [[nodiscard]] bool is_disposed() const noexcept { return m_is_disposed; }

    [[nodiscard]] bool can_read() const noexcept { return true; }
    [[nodiscard]] bool can_write() const noexcept { return false; }
    [[nodiscard]] bool can_seek() const noexcept { return m_can_seek; }

    [[nodiscard]] auto length() const -> std::int64_t;
    [[noreturn]] void set_length(std::int64_t value);

    [[nodiscard]] auto position() const -> std::int64_t;

    /// Same as seek(value, seek_origin::begin).
    ///
    /// \throw std::out_of_range
    /// If \p value is negative.
    void set_position(std::int64_t value);

    /// A target past the end of the column is allowed: the position moves
    /// there, reads return 0 and the buffer stays at the end of the column.
    ///
    /// \return
    /// The new position relative to the start of the column.
    ///
    /// \throw not_supported
    /// If the stream is not seekable.
    /// \throw std::out_of_range
    /// If \p offset does not fit in 31 bits. seek_before_begin if the target
    /// lies before the start of the column.
    auto seek(std::int64_t offset, seek_origin origin) -> std::int64_t;

    void flush() const;
    auto flush_async(cancellation_token ct = {}) const -> task<>;

    /// \return
    /// The next byte, or -1 at the end of the column.
    auto read_byte() -> int;

    /// Read up to buffer.size() bytes. Returns 0 at the end of the column.
    auto read(std::span<std::byte> buffer) -> std::size_t;

    /// Read up to \p count bytes into buffer[offset, offset + count).
    auto read(std::byte* buffer, std::size_t buffer_size, int offset, int count) -> std::size_t;

    /// Asynchronous read(). Disposed-state and argument errors are thrown
    /// by the call itself, everything else by awaiting the returned task.
    auto read_async(std::span<std::byte> buffer, cancellation_token ct = {}) -> task<std::size_t>;
    auto read_async(std::byte* buffer, std::size_t buffer_size, int offset, int count, cancellation_token ct = {})
        -> task<std::size_t>;

    /// \throw not_supported
    /// Always.
    [[noreturn]] void write(std::span<const std::byte> buffer);

    /// Skip the unread rest of the column (blocking for I/O if needed) and
    /// deactivate the stream. A no-op if already disposed.
    ///
    /// If skipping fails the error propagates and the stream stays active.
    void dispose();

    /// Asynchronous dispose().
    auto dispose_async() -> task<>;

private:
    auto dispose_core(bool async) -> task<>;
    auto read_long(std::span<std::byte> buffer, cancellation_token ct) -> task<std::size_t>;
    auto bounded_count(std::size_t requested) const noexcept -> std::size_t;
    void check_disposed() const;

    connector& m_connector;
    shared_read_buffer& m_buffer;
    const bool m_start_cancellable_operations;

    std::int32_t m_start = 0;
    std::int32_t m_len = 0;
    std::int32_t m_read = 0;
    bool m_can_seek = false;
    bool m_is_disposed = true;
};

}

#endif //PGWIRE_COLUMN_STREAM_H
