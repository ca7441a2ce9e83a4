//
// Created by Jesson on 2026/10/18.
//

#include "../../include/pgwire/io/socket_byte_source.h"

#include <glog/logging.h>

#include <cerrno>
#include <system_error>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

pgwire::socket_byte_source::socket_byte_source(int fd, std::chrono::milliseconds poll_interval)
    : m_fd(fd)
    , m_poll_interval(poll_interval.count() > 0 ? poll_interval : std::chrono::milliseconds{1}) {
    if (m_fd < 0) {
        throw std::system_error(EBADF, std::system_category(), "socket_byte_source: invalid file descriptor");
    }
}

pgwire::socket_byte_source::~socket_byte_source() {
    if (m_fd != -1) {
        ::close(m_fd);
    }
}

auto pgwire::socket_byte_source::read_some(std::span<std::byte> buffer, bool async, cancellation_token ct)
    -> task<std::size_t> {
    if (buffer.empty()) {
        co_return 0;
    }
    if (async) {
        wait_readable(ct);
    }
    co_return receive(buffer);
}

void pgwire::socket_byte_source::shutdown_read() noexcept {
    ::shutdown(m_fd, SHUT_RD);
}

auto pgwire::socket_byte_source::wait_readable(const cancellation_token& ct) const -> void {
    pollfd pfd{};
    pfd.fd = m_fd;
    pfd.events = POLLIN;

    while (true) {
        ct.throw_if_cancellation_requested();
        const int result = ::poll(&pfd, 1, static_cast<int>(m_poll_interval.count()));
        if (result > 0) {
            // Readable, hung up or errored: recv() reports which.
            return;
        }
        if (result < 0 && errno != EINTR) {
            const int error = errno;
            LOG(ERROR) << "poll() failed on fd " << m_fd << ": " << std::system_category().message(error);
            throw std::system_error(error, std::system_category(), "Error waiting for socket data: poll()");
        }
    }
}

auto pgwire::socket_byte_source::receive(std::span<std::byte> buffer) const -> std::size_t {
    while (true) {
        const ssize_t result = ::recv(m_fd, buffer.data(), buffer.size(), 0);
        if (result >= 0) {
            VLOG(2) << "recv() on fd " << m_fd << " returned " << result << " bytes";
            return static_cast<std::size_t>(result);
        }
        if (errno != EINTR) {
            const int error = errno;
            LOG(ERROR) << "recv() failed on fd " << m_fd << ": " << std::system_category().message(error);
            throw std::system_error(error, std::system_category(), "Error receiving from socket: recv()");
        }
    }
}
