//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_SYNC_WAIT_H
#define PGWIRE_SYNC_WAIT_H

#include "lightweight_manual_reset_event.h"
#include "sync_wait_task.h"
#include "../types/task.h"

#include <type_traits>
#include <utility>

namespace pgwire {

/// Runs a task to completion on the calling thread, blocking while it is
/// suspended, and returns its result or rethrows its exception.
///
/// This is how every blocking entry point in the library is built from its
/// coroutine counterpart: the coroutine is called with async = false, its
/// body never suspends, and sync_wait() only unwraps the result.
template<typename T>
auto sync_wait(task<T>&& t) -> T {
    auto wait_task = detail::make_sync_wait_task(t);
    detail::lightweight_manual_reset_event event;
    wait_task.start(event);
    event.wait();
    if constexpr (std::is_void_v<T>) {
        wait_task.result();
    }
    else if constexpr (std::is_reference_v<T>) {
        return wait_task.result();
    }
    else {
        return T(std::move(wait_task.result()));
    }
}

}

#endif //PGWIRE_SYNC_WAIT_H
