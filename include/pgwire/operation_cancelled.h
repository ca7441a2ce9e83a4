//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_OPERATION_CANCELLED_H
#define PGWIRE_OPERATION_CANCELLED_H

#include <exception>

namespace pgwire {

/// Thrown by an asynchronous operation that observed a cancellation request
/// on its cancellation_token before it completed.
class operation_cancelled final : public std::exception {
public:
    operation_cancelled() noexcept = default;
    const char* what() const noexcept override { return "operation cancelled"; }
};

}

#endif //PGWIRE_OPERATION_CANCELLED_H
