//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_SYNC_WAIT_TASK_H
#define PGWIRE_SYNC_WAIT_TASK_H

#include "lightweight_manual_reset_event.h"
#include "../types/task.h"

#include <cassert>
#include <coroutine>
#include <exception>
#include <memory>
#include <type_traits>
#include <utility>

namespace pgwire::detail {

/// Result type of `co_await t` where t is an lvalue task<T>.
template<typename T>
using task_await_result_t = decltype(std::declval<const task<T>&>().operator co_await().await_resume());

template<typename RESULT>
class sync_wait_task;

template<typename RESULT>
class sync_wait_task_promise final {
    using coroutine_handle_t = std::coroutine_handle<sync_wait_task_promise<RESULT>>;
public:
    using reference = RESULT&&;

    sync_wait_task_promise() noexcept {}

    void start(lightweight_manual_reset_event& event) {
        m_event = &event;
        coroutine_handle_t::from_promise(*this).resume();
    }

    auto get_return_object() noexcept {
        return coroutine_handle_t::from_promise(*this);
    }

    std::suspend_always initial_suspend() noexcept {
        return {};
    }

    auto final_suspend() noexcept {
        class completion_notifier {
        public:
            bool await_ready() const noexcept { return false; }

            void await_suspend(coroutine_handle_t handle) const noexcept {
                handle.promise().m_event->set();
            }

            void await_resume() noexcept {}
        };
        return completion_notifier{};
    }

    auto yield_value(reference result) noexcept {
        m_result = std::addressof(result);
        return final_suspend();
    }

    void return_void() noexcept {
        // Reached only if the awaited task neither produced a value nor threw.
        assert(false);
    }

    void unhandled_exception() {
        m_exception = std::current_exception();
    }

    reference result() {
        if (m_exception) {
            std::rethrow_exception(m_exception);
        }
        return static_cast<reference>(*m_result);
    }

private:
    lightweight_manual_reset_event* m_event = nullptr;
    std::remove_reference_t<RESULT>* m_result = nullptr;
    std::exception_ptr m_exception;
};

template<>
class sync_wait_task_promise<void> final {
    using coroutine_handle_t = std::coroutine_handle<sync_wait_task_promise<void>>;
public:
    sync_wait_task_promise() noexcept {}

    void start(lightweight_manual_reset_event& event) {
        m_event = &event;
        coroutine_handle_t::from_promise(*this).resume();
    }

    auto get_return_object() noexcept {
        return coroutine_handle_t::from_promise(*this);
    }

    std::suspend_always initial_suspend() noexcept {
        return {};
    }

    auto final_suspend() noexcept {
        class completion_notifier {
        public:
            bool await_ready() const noexcept { return false; }

            void await_suspend(coroutine_handle_t handle) const noexcept {
                handle.promise().m_event->set();
            }

            void await_resume() noexcept {}
        };
        return completion_notifier{};
    }

    void return_void() noexcept {}

    void unhandled_exception() {
        m_exception = std::current_exception();
    }

    void result() {
        if (m_exception) {
            std::rethrow_exception(m_exception);
        }
    }

private:
    lightweight_manual_reset_event* m_event = nullptr;
    std::exception_ptr m_exception;
};

template<typename RESULT>
class sync_wait_task final {
public:
    using promise_type = sync_wait_task_promise<RESULT>;
    using coroutine_handle_t = std::coroutine_handle<promise_type>;

    sync_wait_task(coroutine_handle_t coroutine) noexcept : m_handle(coroutine) {}
    sync_wait_task(sync_wait_task&& other) noexcept : m_handle(std::exchange(other.m_handle, coroutine_handle_t{})) {}
    ~sync_wait_task() {
        if (m_handle) {
            m_handle.destroy();
        }
    }

    sync_wait_task(const sync_wait_task&) = delete;
    sync_wait_task& operator=(const sync_wait_task&) = delete;

    void start(lightweight_manual_reset_event& event) noexcept {
        m_handle.promise().start(event);
    }

    decltype(auto) result() {
        return m_handle.promise().result();
    }

private:
    coroutine_handle_t m_handle;
};

template<typename T, std::enable_if_t<!std::is_void_v<T>, int> = 0>
auto make_sync_wait_task(const task<T>& t) -> sync_wait_task<task_await_result_t<T>> {
    co_yield co_await t;
}

template<typename T, std::enable_if_t<std::is_void_v<T>, int> = 0>
auto make_sync_wait_task(const task<T>& t) -> sync_wait_task<void> {
    co_await t;
}

}

#endif //PGWIRE_SYNC_WAIT_TASK_H
