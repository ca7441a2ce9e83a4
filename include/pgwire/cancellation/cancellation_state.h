//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_CANCELLATION_STATE_H
#define PGWIRE_CANCELLATION_STATE_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace pgwire {

class cancellation_registration;

}

namespace pgwire::detail {

/// Shared state behind a cancellation_source and the tokens and
/// registrations derived from it.
class cancellation_state {
public:
    /// \throw std::bad_alloc
    static cancellation_state* create() {
        return new cancellation_state();
    }

    /// Reference held by each cancellation_token and cancellation_registration.
    void add_token_ref() noexcept {
        m_state.fetch_add(token_ref_increment, std::memory_order_relaxed);
    }

    void release_token_ref() noexcept {
        const std::uint64_t old_state = m_state.fetch_sub(token_ref_increment, std::memory_order_acq_rel);
        if ((old_state & ref_count_mask) == token_ref_increment) {
            delete this;
        }
    }

    /// Reference held by each cancellation_source. The state stops being
    /// cancellable when the last one is released without a request.
    void add_source_ref() noexcept {
        m_state.fetch_add(source_ref_increment, std::memory_order_relaxed);
    }

    void release_source_ref() noexcept {
        const std::uint64_t old_state = m_state.fetch_sub(source_ref_increment, std::memory_order_acq_rel);
        if ((old_state & ref_count_mask) == source_ref_increment) {
            delete this;
        }
    }

    bool can_be_cancelled() const noexcept {
        return (m_state.load(std::memory_order_acquire) & can_be_cancelled_mask) != 0;
    }

    bool is_cancellation_requested() const noexcept {
        return (m_state.load(std::memory_order_acquire) & cancellation_requested_flag) != 0;
    }

    /// Set the requested flag and run every registered callback on the
    /// calling thread. Only the first call does anything.
    void request_cancellation();

    /// \return
    /// false if cancellation was already requested, in which case the
    /// caller is expected to run the callback itself.
    bool try_register_callback(cancellation_registration* registration);

    /// Blocks while the registration's callback is running on another thread.
    void deregister_callback(cancellation_registration* registration) noexcept;

private:
    cancellation_state() noexcept
        : m_state(source_ref_increment)
        , m_running(nullptr) {}

    ~cancellation_state() = default;

    static constexpr std::uint64_t cancellation_requested_flag = 1;
    static constexpr std::uint64_t source_ref_increment = 2;
    static constexpr std::uint64_t token_ref_increment = UINT64_C(1) << 32;
    // source refs plus the requested flag: once requested, tokens stay cancellable.
    static constexpr std::uint64_t can_be_cancelled_mask = token_ref_increment - 1;
    static constexpr std::uint64_t ref_count_mask = ~cancellation_requested_flag;

    // bit 0     - cancellation requested
    // bits 1-31 - cancellation_source ref count
    // bits 32+  - cancellation_token / cancellation_registration ref count
    std::atomic<std::uint64_t> m_state;

    std::mutex m_mutex;
    std::condition_variable m_callback_finished;
    std::vector<cancellation_registration*> m_registrations;
    cancellation_registration* m_running;
    std::thread::id m_notification_thread_id;
};

}

#endif //PGWIRE_CANCELLATION_STATE_H
