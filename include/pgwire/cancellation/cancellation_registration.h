//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_CANCELLATION_REGISTRATION_H
#define PGWIRE_CANCELLATION_REGISTRATION_H

#include "cancellation_token.h"

#include <functional>
#include <type_traits>
#include <utility>

namespace pgwire {

namespace detail {

class cancellation_state;

}

class cancellation_registration {
public:
    /// Registers the callback to be executed when cancellation is requested
    /// on the cancellation_token.
    ///
    /// If cancellation has already been requested the callback runs
    /// immediately, before the constructor returns. Otherwise it runs on the
    /// first thread to call cancellation_source::request_cancellation().
    ///
    /// \param token
    /// The cancellation token to register the callback with.
    ///
    /// \param callback
    /// Must not throw when invoked; an exception escaping it calls
    /// std::terminate().
    ///
    /// \throw std::bad_alloc
    /// If registration failed due to insufficient memory available.
    template<
        typename FUNC,
        typename = std::enable_if_t<std::is_constructible_v<std::function<void()>, FUNC&&>>>
    cancellation_registration(cancellation_token token, FUNC&& callback)
        : m_state(nullptr)
        , m_callback(std::forward<FUNC>(callback)) {
        register_callback(std::move(token));
    }

    cancellation_registration(const cancellation_registration& other) = delete;
    cancellation_registration& operator=(const cancellation_registration& other) = delete;

    /// Deregisters the callback.
    ///
    /// Once the destructor returns the callback is guaranteed not to be
    /// running and not to run later. If the callback is running on another
    /// thread this blocks until it has returned.
    ~cancellation_registration();

private:
    friend class detail::cancellation_state;

    void register_callback(cancellation_token&& token);

    void invoke() noexcept { m_callback(); }

    detail::cancellation_state* m_state;
    std::function<void()> m_callback;
};

}

#endif //PGWIRE_CANCELLATION_REGISTRATION_H
