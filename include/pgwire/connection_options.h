//
// Created by Jesson on 2026/10/18.
//

#ifndef PGWIRE_CONNECTION_OPTIONS_H
#define PGWIRE_CONNECTION_OPTIONS_H

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdint>
#include <string>

namespace pgwire {

struct connection_options {
    // Capacity of the connection's read buffer. Columns larger than this
    // can only be read sequentially.
    std::int32_t read_buffer_size = 8192;

    // Whether asynchronous column reads link the caller's cancellation
    // token to the connector.
    bool start_cancellable_operations = true;

    // How often a socket read waiting for data re-checks its token.
    std::chrono::milliseconds socket_poll_interval{50};
};

/// Parse the `connection` mapping of \p root. Missing keys keep their
/// defaults, unknown keys are ignored.
///
/// \throw config_error
/// If a value has the wrong type or is out of range.
auto load_connection_options(const YAML::Node& root) -> connection_options;

/// \throw config_error
/// If the file can't be read or parsed, or holds an invalid value.
auto load_connection_options_file(const std::string& path) -> connection_options;

}

#endif //PGWIRE_CONNECTION_OPTIONS_H
