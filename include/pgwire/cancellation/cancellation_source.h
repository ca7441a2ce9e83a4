//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_CANCELLATION_SOURCE_H
#define PGWIRE_CANCELLATION_SOURCE_H

namespace pgwire {

class cancellation_token;

namespace detail {

class cancellation_state;

}

class cancellation_source {
public:
    /// Construct to a new cancellation source.
    cancellation_source();

    /// Create a new reference to the same underlying cancellation
    /// source as \p other.
    cancellation_source(const cancellation_source& other) noexcept;

    cancellation_source(cancellation_source&& other) noexcept;

    ~cancellation_source();

    auto operator=(const cancellation_source& other) noexcept -> cancellation_source&;

    auto operator=(cancellation_source&& other) noexcept -> cancellation_source&;

    /// False once this source has been moved from.
    auto can_be_cancelled() const noexcept -> bool;

    /// Obtain a token that observes cancellation requests made on this source.
    auto token() const noexcept -> cancellation_token;

    /// Request cancellation of operations that were passed an associated
    /// cancellation token.
    ///
    /// Registered callbacks run inside this call on the first thread to make
    /// the request. Later calls are no-ops.
    auto request_cancellation() const -> void;

    auto is_cancellation_requested() const noexcept -> bool;

private:
    detail::cancellation_state* m_state;
};

}

#endif //PGWIRE_CANCELLATION_SOURCE_H
