//
// Created by Jesson on 2026/10/18.
//

#include "../../include/pgwire/cancellation/cancellation_source.h"
#include "../../include/pgwire/cancellation/cancellation_state.h"
#include "../../include/pgwire/cancellation/cancellation_token.h"

pgwire::cancellation_source::cancellation_source() : m_state(detail::cancellation_state::create()) {}

pgwire::cancellation_source::cancellation_source(const cancellation_source& other) noexcept : m_state(other.m_state) {
    if (m_state) {
        m_state->add_source_ref();
    }
}

pgwire::cancellation_source::cancellation_source(cancellation_source&& other) noexcept : m_state(other.m_state) {
    other.m_state = nullptr;
}

pgwire::cancellation_source::~cancellation_source() {
    if (m_state) {
        m_state->release_source_ref();
    }
}

auto pgwire::cancellation_source::operator=(const cancellation_source& other) noexcept -> cancellation_source& {
    if (m_state != other.m_state) {
        if (m_state) {
            m_state->release_source_ref();
        }
        m_state = other.m_state;
        if (m_state) {
            m_state->add_source_ref();
        }
    }
    return *this;
}

auto pgwire::cancellation_source::operator=(cancellation_source&& other) noexcept -> cancellation_source& {
    if (this != &other) {
        if (m_state) {
            m_state->release_source_ref();
        }
        m_state = other.m_state;
        other.m_state = nullptr;
    }
    return *this;
}

auto pgwire::cancellation_source::can_be_cancelled() const noexcept -> bool {
    return m_state != nullptr;
}

auto pgwire::cancellation_source::token() const noexcept -> cancellation_token {
    return cancellation_token(m_state);
}

auto pgwire::cancellation_source::request_cancellation() const -> void {
    if (m_state) {
        m_state->request_cancellation();
    }
}

auto pgwire::cancellation_source::is_cancellation_requested() const noexcept -> bool {
    return m_state && m_state->is_cancellation_requested();
}
