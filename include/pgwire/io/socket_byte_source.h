//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_SOCKET_BYTE_SOURCE_H
#define PGWIRE_SOCKET_BYTE_SOURCE_H

#include "byte_source.h"

#include <chrono>

namespace pgwire {

/// A byte_source over a connected stream socket. Takes ownership of the
/// file descriptor.
///
/// Synchronous reads block in recv(). Asynchronous reads wait in poll() in
/// slices of \p poll_interval and check their cancellation token between
/// slices.
class socket_byte_source final : public byte_source {
public:
    explicit socket_byte_source(int fd, std::chrono::milliseconds poll_interval = std::chrono::milliseconds{50});
    ~socket_byte_source() override;

    socket_byte_source(const socket_byte_source&) = delete;
    socket_byte_source& operator=(const socket_byte_source&) = delete;

    /// With async = true this still blocks the calling thread: it polls in
    /// slices of the poll interval and never suspends, since there is no
    /// event loop to resume it from. Cancellation is noticed between slices.
    auto read_some(std::span<std::byte> buffer, bool async, cancellation_token ct)
        -> task<std::size_t> override;

    int native_handle() const noexcept { return m_fd; }

    /// Shut down the receive side so a reader blocked in recv() sees end of stream.
    void shutdown_read() noexcept;

private:
    auto wait_readable(const cancellation_token& ct) const -> void;
    auto receive(std::span<std::byte> buffer) const -> std::size_t;

    int m_fd;
    std::chrono::milliseconds m_poll_interval;
};

}

#endif //PGWIRE_SOCKET_BYTE_SOURCE_H
