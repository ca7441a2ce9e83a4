//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_CONNECTOR_H
#define PGWIRE_CONNECTOR_H

#include "cancellable_operation_scope.h"
#include "column_stream.h"
#include "connection_options.h"
#include "cancellation/cancellation_source.h"
#include "cancellation/cancellation_token.h"
#include "io/byte_source.h"
#include "io/read_buffer.h"
#include "types/task.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

namespace pgwire {

/// One physical connection: the transport, the read buffer fed from it,
/// and the column_stream instance reused for every column read from it.
///
/// The connector also owns the connection-wide cancellation mechanism.
/// Operations link the caller's token to it through
/// start_nested_cancellable_operation(); a cancellation request then sets
/// the connector's user cancellation token and, if the operation asked for
/// it, invokes the protocol cancel handler (which would send a cancel
/// request to the server on a separate connection).
class connector {
public:
    explicit connector(std::unique_ptr<byte_source> source, const connection_options& options = {});

    /// A connector over a connected stream socket. Takes ownership of \p fd.
    static auto over_socket(int fd, const connection_options& options = {}) -> std::unique_ptr<connector>;

    connector(const connector&) = delete;
    connector& operator=(const connector&) = delete;

    auto read_buffer() noexcept -> pgwire::read_buffer& { return m_read_buffer; }

    /// Hand out the column stream positioned over the next \p length bytes.
    ///
    /// A stream still active from the previous column is disposed first,
    /// which skips its unread bytes. For \p seekable columns the whole
    /// value is buffered before the stream is returned.
    ///
    /// \throw std::invalid_argument
    /// If \p length is negative, or \p seekable and the value does not fit
    /// in the read buffer.
    /// \throw object_disposed
    /// After close().
    auto open_column_stream(std::int32_t length, bool seekable) -> column_stream&;

    auto open_column_stream_async(std::int32_t length, bool seekable, cancellation_token ct = {})
        -> task<column_stream&>;

    /// Link \p ct to this connection until the returned scope is released.
    ///
    /// Scopes nest: only the outermost one starts a new cancellation cycle,
    /// inner ones add their token to it.
    auto start_nested_cancellable_operation(cancellation_token ct, bool attempt_protocol_cancel)
        -> cancellable_operation_scope;

    /// Invoked when a linked token is cancelled by an operation that asked
    /// for protocol-level cancellation.
    void set_protocol_cancel_handler(std::function<void()> handler);

    /// Cancelled when a token linked to the current operation is cancelled.
    [[nodiscard]] auto user_cancellation_token() const -> cancellation_token;
    [[nodiscard]] bool user_cancellation_requested() const;
    [[nodiscard]] bool is_in_cancellable_operation() const noexcept;

    /// Dispose the active column stream and refuse further columns.
    void close();
    [[nodiscard]] bool is_closed() const noexcept { return m_closed; }

private:
    friend class cancellable_operation_scope;

    void enter_cancellable_operation();
    void exit_cancellable_operation() noexcept;
    void perform_user_cancellation(bool attempt_protocol_cancel);
    void check_open() const;
    void check_column_length(std::int32_t length, bool seekable) const;

    connection_options m_options;
    std::unique_ptr<byte_source> m_source;
    pgwire::read_buffer m_read_buffer;
    column_stream m_column_stream;

    mutable std::mutex m_cancellation_mutex;
    cancellation_source m_user_cancellation;
    std::function<void()> m_protocol_cancel_handler;
    std::atomic<int> m_cancellable_depth;

    bool m_closed;
};

}

#endif //PGWIRE_CONNECTOR_H
