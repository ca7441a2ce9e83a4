//
// Created by Jesson on 2026/10/18.
//

#include "../../include/pgwire/cancellable_operation_scope.h"
#include "../../include/pgwire/connector.h"

#include <utility>

pgwire::cancellable_operation_scope::cancellable_operation_scope(
    connector& owner, cancellation_token ct, bool attempt_protocol_cancel)
    : m_owner(&owner) {
    owner.enter_cancellable_operation();
    if (ct.can_be_cancelled()) {
        try {
            // Runs the callback immediately if ct is already cancelled.
            m_registration = std::make_unique<cancellation_registration>(
                std::move(ct),
                [&owner, attempt_protocol_cancel] { owner.perform_user_cancellation(attempt_protocol_cancel); });
        }
        catch (...) {
            owner.exit_cancellable_operation();
            throw;
        }
    }
}

pgwire::cancellable_operation_scope::cancellable_operation_scope(cancellable_operation_scope&& other) noexcept
    : m_owner(std::exchange(other.m_owner, nullptr))
    , m_registration(std::move(other.m_registration)) {}

auto pgwire::cancellable_operation_scope::operator=(cancellable_operation_scope&& other) noexcept
    -> cancellable_operation_scope& {
    if (this != &other) {
        release();
        m_owner = std::exchange(other.m_owner, nullptr);
        m_registration = std::move(other.m_registration);
    }
    return *this;
}

pgwire::cancellable_operation_scope::~cancellable_operation_scope() {
    release();
}

void pgwire::cancellable_operation_scope::release() noexcept {
    if (!m_owner) {
        return;
    }
    // Deregister first so the callback can't reach the connector after we leave.
    m_registration.reset();
    std::exchange(m_owner, nullptr)->exit_cancellable_operation();
}
