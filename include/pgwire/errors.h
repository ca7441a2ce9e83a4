//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_ERRORS_H
#define PGWIRE_ERRORS_H

#include <stdexcept>
#include <string>

namespace pgwire {

/// An operation was attempted on a column_stream that is disposed or was
/// never initialized.
class object_disposed : public std::logic_error {
public:
    explicit object_disposed(const std::string& object_name)
        : std::logic_error("Cannot access a disposed object: " + object_name) {}
};

/// The operation is not supported by this stream (seeking a sequential
/// column, writing, resizing).
class not_supported : public std::logic_error {
public:
    explicit not_supported(const std::string& what) : std::logic_error(what) {}
};

/// A seek computed a target position before the start of the column.
class seek_before_begin : public std::out_of_range {
public:
    seek_before_begin()
        : std::out_of_range("An attempt was made to move the position before the beginning of the stream.") {}
};

/// The server closed the connection while more bytes were expected.
class end_of_stream : public std::runtime_error {
public:
    end_of_stream()
        : std::runtime_error("Exception while reading from stream: connection closed by the server") {}
};

/// A connection option had an invalid value.
class config_error : public std::runtime_error {
public:
    explicit config_error(const std::string& what) : std::runtime_error(what) {}
};

}

#endif //PGWIRE_ERRORS_H
