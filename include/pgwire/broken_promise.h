//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_BROKEN_PROMISE_H
#define PGWIRE_BROKEN_PROMISE_H

#include <stdexcept>

namespace pgwire {

/// \brief
/// Thrown when the result of a default-constructed or moved-from task is
/// awaited.
class broken_promise : public std::logic_error {
public:
    broken_promise() : std::logic_error("broken promise") {}
};

}

#endif //PGWIRE_BROKEN_PROMISE_H
