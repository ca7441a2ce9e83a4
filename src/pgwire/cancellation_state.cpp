//
// Created by Jesson on 2026/10/18.
//

#include "../../include/pgwire/cancellation/cancellation_state.h"
#include "../../include/pgwire/cancellation/cancellation_registration.h"

#include <algorithm>

void pgwire::detail::cancellation_state::request_cancellation() {
    const std::uint64_t old_state = m_state.fetch_or(cancellation_requested_flag, std::memory_order_seq_cst);
    if ((old_state & cancellation_requested_flag) != 0) {
        // Some other thread has already requested cancellation.
        return;
    }

    std::unique_lock lock(m_mutex);
    m_notification_thread_id = std::this_thread::get_id();

    // Callbacks run without the lock held so they may deregister other
    // registrations or request cancellation on other sources.
    while (!m_registrations.empty()) {
        // Oldest registration first.
        auto* registration = m_registrations.front();
        m_registrations.erase(m_registrations.begin());
        m_running = registration;
        lock.unlock();

        registration->invoke();

        lock.lock();
        m_running = nullptr;
        m_callback_finished.notify_all();
    }
}

bool pgwire::detail::cancellation_state::try_register_callback(cancellation_registration* registration) {
    std::lock_guard lock(m_mutex);
    if (is_cancellation_requested()) {
        return false;
    }
    m_registrations.push_back(registration);
    return true;
}

void pgwire::detail::cancellation_state::deregister_callback(cancellation_registration* registration) noexcept {
    std::unique_lock lock(m_mutex);
    const auto it = std::find(m_registrations.begin(), m_registrations.end(), registration);
    if (it != m_registrations.end()) {
        m_registrations.erase(it);
        return;
    }

    // Already taken off the list by request_cancellation(). A callback that
    // deregisters itself from inside its own invocation must not wait.
    if (m_notification_thread_id == std::this_thread::get_id()) {
        return;
    }
    m_callback_finished.wait(lock, [&] { return m_running != registration; });
}
