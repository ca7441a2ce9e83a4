//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_CANCELLABLE_OPERATION_SCOPE_H
#define PGWIRE_CANCELLABLE_OPERATION_SCOPE_H

#include "cancellation/cancellation_registration.h"
#include "cancellation/cancellation_token.h"

#include <memory>

namespace pgwire {

class connector;

/// Links a caller's cancellation_token to a connector for the duration of
/// one operation. Returned by connector::start_nested_cancellable_operation().
///
/// While the scope is alive, cancelling the token asks the connector to
/// interrupt its pending I/O. The scope only forwards the request; what
/// happens to the I/O is up to the connector. Destroying (or release()ing)
/// the scope deregisters the token and leaves the operation.
class cancellable_operation_scope {
public:
    /// A scope that is not linked to any connector.
    cancellable_operation_scope() noexcept = default;

    cancellable_operation_scope(connector& owner, cancellation_token ct, bool attempt_protocol_cancel);

    cancellable_operation_scope(cancellable_operation_scope&& other) noexcept;
    cancellable_operation_scope& operator=(cancellable_operation_scope&& other) noexcept;
    cancellable_operation_scope(const cancellable_operation_scope&) = delete;
    cancellable_operation_scope& operator=(const cancellable_operation_scope&) = delete;

    ~cancellable_operation_scope();

    /// Leave the operation now. Idempotent.
    void release() noexcept;

    [[nodiscard]] bool is_active() const noexcept { return m_owner != nullptr; }

private:
    connector* m_owner = nullptr;
    std::unique_ptr<cancellation_registration> m_registration;
};

}

#endif //PGWIRE_CANCELLABLE_OPERATION_SCOPE_H
