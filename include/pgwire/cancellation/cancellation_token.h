//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_CANCELLATION_TOKEN_H
#define PGWIRE_CANCELLATION_TOKEN_H

namespace pgwire {

class cancellation_source;
class cancellation_registration;

namespace detail {

class cancellation_state;

}

class cancellation_token {
public:
    /// Construct to a cancellation token that can't be cancelled.
    cancellation_token() noexcept;
    cancellation_token(const cancellation_token& other) noexcept;
    cancellation_token(cancellation_token&& other) noexcept;
    ~cancellation_token();
    cancellation_token& operator=(const cancellation_token& other) noexcept;
    cancellation_token& operator=(cancellation_token&& other) noexcept;
    void swap(cancellation_token& other) noexcept;

    /// Query if it is possible that this operation will be cancelled.
    ///
    /// Operations may skip registering for cancellation when this is false.
    [[nodiscard]] auto can_be_cancelled() const noexcept -> bool;

    /// Query if cancellation has been requested on an associated
    /// cancellation_source.
    [[nodiscard]] auto is_cancellation_requested() const noexcept -> bool;

    /// Throws pgwire::operation_cancelled if cancellation has been requested.
    auto throw_if_cancellation_requested() const -> void;

private:
    friend class cancellation_source;
    friend class cancellation_registration;

    explicit cancellation_token(detail::cancellation_state* state) noexcept;

    detail::cancellation_state* m_state;
};

inline void swap(cancellation_token& a, cancellation_token& b) noexcept {
    a.swap(b);
}

}

#endif //PGWIRE_CANCELLATION_TOKEN_H
