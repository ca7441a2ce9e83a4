//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_BYTE_SOURCE_H
#define PGWIRE_BYTE_SOURCE_H

#include "../cancellation/cancellation_token.h"
#include "../types/task.h"

#include <cstddef>
#include <span>

namespace pgwire {

/// The transport a read_buffer fills from.
class byte_source {
public:
    virtual ~byte_source() = default;

    /// Read at least one and at most buffer.size() bytes.
    ///
    /// With async = false the returned task must complete without
    /// suspending (the calling thread blocks inside it instead). With
    /// async = true it may suspend until data arrives and must throw
    /// operation_cancelled if \p ct is cancelled before any byte is
    /// delivered.
    ///
    /// \return
    /// Number of bytes stored, or 0 if the peer closed the connection.
    virtual auto read_some(std::span<std::byte> buffer, bool async, cancellation_token ct)
        -> task<std::size_t> = 0;
};

}

#endif //PGWIRE_BYTE_SOURCE_H
