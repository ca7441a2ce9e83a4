//
// Created by Jesson on 2026/10/18.
//

#include "../../include/pgwire/cancellation/cancellation_registration.h"
#include "../../include/pgwire/cancellation/cancellation_state.h"

pgwire::cancellation_registration::~cancellation_registration() {
    if (m_state) {
        m_state->deregister_callback(this);
        m_state->release_token_ref();
    }
}

void pgwire::cancellation_registration::register_callback(cancellation_token&& token) {
    auto* state = token.m_state;
    if (!state || !state->can_be_cancelled()) {
        return;
    }

    if (state->try_register_callback(this)) {
        // The token's reference moves into the registration.
        m_state = state;
        token.m_state = nullptr;
    }
    else {
        m_callback();
    }
}
