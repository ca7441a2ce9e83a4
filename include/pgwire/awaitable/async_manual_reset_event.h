//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_ASYNC_MANUAL_RESET_EVENT_H
#define PGWIRE_ASYNC_MANUAL_RESET_EVENT_H

#include <atomic>
#include <cassert>
#include <coroutine>

namespace pgwire {

class async_manual_reset_event_operation;

/// An event coroutines can co_await. Waiters are resumed inside set(), on
/// the thread that calls it.
class async_manual_reset_event {
public:
    explicit async_manual_reset_event(const bool init = false) noexcept
        : m_state(init ? static_cast<void*>(this) : nullptr) {}

    ~async_manual_reset_event() {
        [[maybe_unused]] const auto old_state = m_state.load(std::memory_order_relaxed);
        assert(old_state == nullptr || old_state == static_cast<void*>(this));
    }

    async_manual_reset_event(const async_manual_reset_event&) = delete;
    async_manual_reset_event& operator=(const async_manual_reset_event&) = delete;

    async_manual_reset_event_operation operator co_await() const noexcept;

    auto is_set() const noexcept -> bool {
        return m_state.load(std::memory_order_acquire) == static_cast<const void*>(this);
    }

    auto set() noexcept -> void;

    auto reset() noexcept -> void {
        void* expected = this;
        m_state.compare_exchange_strong(expected, nullptr, std::memory_order_acq_rel);
    }

private:
    friend class async_manual_reset_event_operation;

    // - this    : set
    // - nullptr : not set, no waiters
    // - other   : not set, head of a linked list of waiting operations
    mutable std::atomic<void*> m_state;
};

class async_manual_reset_event_operation {
public:
    explicit async_manual_reset_event_operation(const async_manual_reset_event& event) noexcept
        : m_event(event)
        , m_next(nullptr) {}

    auto await_ready() const noexcept -> bool;
    auto await_suspend(std::coroutine_handle<> awaiter) noexcept -> bool;
    auto await_resume() const noexcept -> void {}

private:
    friend class async_manual_reset_event;

    const async_manual_reset_event& m_event;
    async_manual_reset_event_operation* m_next;
    std::coroutine_handle<> m_awaiter;
};

}

#endif //PGWIRE_ASYNC_MANUAL_RESET_EVENT_H
