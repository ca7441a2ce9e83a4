//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_TASK_H
#define PGWIRE_TASK_H

#include "../broken_promise.h"

#include <cassert>
#include <coroutine>
#include <exception>
#include <memory>
#include <type_traits>
#include <utility>

namespace pgwire {

template<typename T>
class task;

namespace detail {

/// Lazily started coroutine promise. The body runs when the task is first
/// awaited and the awaiter is resumed by symmetric transfer on completion,
/// so a task whose body never suspends completes on the awaiting thread.
class task_promise_base {
    friend struct final_awaitable;
    struct final_awaitable {
        auto await_ready() const noexcept -> bool { return false; }

        template<typename promise_type>
        auto await_suspend(std::coroutine_handle<promise_type> handle) noexcept -> std::coroutine_handle<> {
            if (auto continuation = handle.promise().m_continuation) {
                return continuation;
            }
            return std::noop_coroutine();
        }

        auto await_resume() noexcept -> void {}
    };
public:
    task_promise_base() noexcept = default;

    auto initial_suspend() const noexcept -> std::suspend_always { return {}; }
    auto final_suspend() const noexcept -> final_awaitable { return {}; }

    auto set_continuation(std::coroutine_handle<> continuation) noexcept -> void {
        m_continuation = continuation;
    }
private:
    std::coroutine_handle<> m_continuation;
};

template<typename T>
class task_promise final : public task_promise_base {
public:
    task_promise() noexcept {}

    ~task_promise() {
        switch (m_state) {
        case result_state::value:
            m_value.~T();
            break;
        case result_state::exception:
            m_exception.~exception_ptr();
            break;
        default:
            break;
        }
    }

    auto get_return_object() noexcept -> task<T>;

    auto unhandled_exception() noexcept -> void {
        ::new (static_cast<void*>(std::addressof(m_exception))) std::exception_ptr(std::current_exception());
        m_state = result_state::exception;
    }

    template<typename value_type, typename = std::enable_if_t<std::is_convertible_v<value_type&&, T>>>
    auto return_value(value_type&& value) noexcept(std::is_nothrow_constructible_v<T, value_type&&>) -> void {
        ::new (static_cast<void*>(std::addressof(m_value))) T(std::forward<value_type>(value));
        m_state = result_state::value;
    }

    auto result() & -> T& {
        rethrow_if_exception();
        return m_value;
    }

    auto result() && -> T {
        rethrow_if_exception();
        return std::move(m_value);
    }

private:
    auto rethrow_if_exception() const -> void {
        if (m_state == result_state::exception) {
            std::rethrow_exception(m_exception);
        }
        assert(m_state == result_state::value);
    }

    enum class result_state { empty, value, exception };
    result_state m_state = result_state::empty;
    union {
        T m_value;
        std::exception_ptr m_exception;
    };
};

template<>
class task_promise<void> final : public task_promise_base {
public:
    task_promise() noexcept = default;

    auto get_return_object() noexcept -> task<void>;

    auto return_void() noexcept -> void {}

    auto unhandled_exception() noexcept -> void {
        m_exception = std::current_exception();
    }

    auto result() const -> void {
        if (m_exception) {
            std::rethrow_exception(m_exception);
        }
    }
private:
    std::exception_ptr m_exception;
};

template<typename T>
class task_promise<T&> final : public task_promise_base {
public:
    task_promise() noexcept = default;

    auto get_return_object() noexcept -> task<T&>;

    auto unhandled_exception() noexcept -> void {
        m_exception = std::current_exception();
    }

    auto return_value(T& value) noexcept -> void {
        m_value = std::addressof(value);
    }

    auto result() const -> T& {
        if (m_exception) {
            std::rethrow_exception(m_exception);
        }
        return *m_value;
    }
private:
    T* m_value = nullptr;
    std::exception_ptr m_exception;
};

}

template<typename T = void>
class task {
public:
    using promise_type = detail::task_promise<T>;
    using value_type = T;
private:
    struct awaitable_base {
        explicit awaitable_base(std::coroutine_handle<promise_type> handle) noexcept : m_handle(handle) {}

        auto await_ready() const noexcept -> bool {
            return !m_handle || m_handle.done();
        }

        auto await_suspend(std::coroutine_handle<> awaiter) noexcept -> std::coroutine_handle<> {
            m_handle.promise().set_continuation(awaiter);
            return m_handle;
        }

        std::coroutine_handle<promise_type> m_handle;
    };
public:
    task() noexcept : m_handle(nullptr) {}
    explicit task(std::coroutine_handle<promise_type> handle) noexcept : m_handle(handle) {}
    task(task&& other) noexcept : m_handle(std::exchange(other.m_handle, nullptr)) {}
    task& operator=(task&& other) noexcept {
        if (std::addressof(other) != this) {
            if (m_handle) {
                m_handle.destroy();
            }
            m_handle = std::exchange(other.m_handle, nullptr);
        }
        return *this;
    }
    task(const task&) = delete;
    task& operator=(const task&) = delete;
    ~task() {
        if (m_handle) {
            m_handle.destroy();
        }
    }

    auto is_ready() const noexcept -> bool {
        return !m_handle || m_handle.done();
    }

    auto operator co_await() const & noexcept {
        struct awaitable : awaitable_base {
            using awaitable_base::awaitable_base;

            decltype(auto) await_resume() {
                if (!this->m_handle) {
                    throw broken_promise{};
                }
                return this->m_handle.promise().result();
            }
        };
        return awaitable{m_handle};
    }

    auto operator co_await() const && noexcept {
        struct awaitable : awaitable_base {
            using awaitable_base::awaitable_base;

            decltype(auto) await_resume() {
                if (!this->m_handle) {
                    throw broken_promise{};
                }
                return std::move(this->m_handle.promise()).result();
            }
        };
        return awaitable{m_handle};
    }

private:
    std::coroutine_handle<promise_type> m_handle;
};

namespace detail {

template<typename T>
auto task_promise<T>::get_return_object() noexcept -> task<T> {
    return task<T>{ std::coroutine_handle<task_promise>::from_promise(*this) };
}

inline auto task_promise<void>::get_return_object() noexcept -> task<void> {
    return task<void>{ std::coroutine_handle<task_promise>::from_promise(*this) };
}

template<typename T>
auto task_promise<T&>::get_return_object() noexcept -> task<T&> {
    return task<T&>{ std::coroutine_handle<task_promise>::from_promise(*this) };
}

}

}

#endif //PGWIRE_TASK_H
