//
// Created by Jesson on 2026/10/18.
//

#include "../../include/pgwire/cancellation/cancellation_token.h"
#include "../../include/pgwire/cancellation/cancellation_state.h"
#include "../../include/pgwire/operation_cancelled.h"

#include <utility>

pgwire::cancellation_token::cancellation_token() noexcept : m_state(nullptr) {}

pgwire::cancellation_token::cancellation_token(const cancellation_token& other) noexcept : m_state(other.m_state) {
    if (m_state) {
        m_state->add_token_ref();
    }
}

pgwire::cancellation_token::cancellation_token(cancellation_token&& other) noexcept : m_state(other.m_state) {
    other.m_state = nullptr;
}

pgwire::cancellation_token::~cancellation_token() {
    if (m_state) {
        m_state->release_token_ref();
    }
}

pgwire::cancellation_token& pgwire::cancellation_token::operator=(const cancellation_token& other) noexcept {
    if (other.m_state != m_state) {
        if (m_state) {
            m_state->release_token_ref();
        }
        m_state = other.m_state;
        if (m_state) {
            m_state->add_token_ref();
        }
    }
    return *this;
}

pgwire::cancellation_token& pgwire::cancellation_token::operator=(cancellation_token&& other) noexcept {
    if (this != &other) {
        if (m_state) {
            m_state->release_token_ref();
        }
        m_state = std::exchange(other.m_state, nullptr);
    }
    return *this;
}

void pgwire::cancellation_token::swap(cancellation_token& other) noexcept {
    std::swap(m_state, other.m_state);
}

auto pgwire::cancellation_token::can_be_cancelled() const noexcept -> bool {
    return m_state && m_state->can_be_cancelled();
}

auto pgwire::cancellation_token::is_cancellation_requested() const noexcept -> bool {
    return m_state && m_state->is_cancellation_requested();
}

auto pgwire::cancellation_token::throw_if_cancellation_requested() const -> void {
    if (is_cancellation_requested()) {
        throw operation_cancelled{};
    }
}

pgwire::cancellation_token::cancellation_token(detail::cancellation_state* state) noexcept : m_state(state) {
    if (m_state) {
        m_state->add_token_ref();
    }
}
