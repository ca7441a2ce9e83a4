//
// Created by Jesson on 2026/10/18.
//

#include "../../include/pgwire/detail/lightweight_manual_reset_event.h"

void pgwire::detail::lightweight_manual_reset_event::set() noexcept {
    {
        std::lock_guard lock(m_mutex);
        m_is_set = true;
    }
    m_cv.notify_all();
}

void pgwire::detail::lightweight_manual_reset_event::reset() noexcept {
    std::lock_guard lock(m_mutex);
    m_is_set = false;
}

void pgwire::detail::lightweight_manual_reset_event::wait() noexcept {
    std::unique_lock lock(m_mutex);
    m_cv.wait(lock, [this] { return m_is_set; });
}
