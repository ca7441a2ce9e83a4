//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_LIGHTWEIGHT_MANUAL_RESET_EVENT_H
#define PGWIRE_LIGHTWEIGHT_MANUAL_RESET_EVENT_H

#include <condition_variable>
#include <mutex>

namespace pgwire::detail {

/// Blocks a thread until a coroutine driven by sync_wait() has finished.
class lightweight_manual_reset_event {
public:
    explicit lightweight_manual_reset_event(bool init = false) : m_is_set(init) {}

    void set() noexcept;
    void reset() noexcept;
    void wait() noexcept;

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_is_set;
};

}

#endif //PGWIRE_LIGHTWEIGHT_MANUAL_RESET_EVENT_H
