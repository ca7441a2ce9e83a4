//
// Created by Jesson on 2026/10/18.
//

#include "../../include/pgwire/connection_options.h"
#include "../../include/pgwire/errors.h"
#include "../../include/pgwire/io/read_buffer.h"

#include <glog/logging.h>

#include <string>

namespace {

template<typename T>
auto read_scalar(const YAML::Node& node, const char* key) -> T {
    try {
        return node.as<T>();
    }
    catch (const YAML::Exception& e) {
        throw pgwire::config_error(std::string("connection.") + key + ": " + e.what());
    }
}

}

auto pgwire::load_connection_options(const YAML::Node& root) -> connection_options {
    connection_options options;

    const auto connection = root["connection"];
    if (!connection) {
        return options;
    }
    if (!connection.IsMap()) {
        throw config_error("connection: expected a mapping");
    }

    if (const auto node = connection["read_buffer_size"]) {
        const auto size = read_scalar<std::int64_t>(node, "read_buffer_size");
        if (size <= 0 || size > read_buffer::max_size) {
            throw config_error(
                "connection.read_buffer_size: must be in [1, " + std::to_string(read_buffer::max_size) +
                "], got " + std::to_string(size));
        }
        options.read_buffer_size = static_cast<std::int32_t>(size);
    }

    if (const auto node = connection["start_cancellable_operations"]) {
        options.start_cancellable_operations = read_scalar<bool>(node, "start_cancellable_operations");
    }

    if (const auto node = connection["socket_poll_interval_ms"]) {
        const auto interval = read_scalar<std::int64_t>(node, "socket_poll_interval_ms");
        if (interval <= 0) {
            throw config_error("connection.socket_poll_interval_ms: must be > 0, got " + std::to_string(interval));
        }
        options.socket_poll_interval = std::chrono::milliseconds{interval};
    }

    return options;
}

auto pgwire::load_connection_options_file(const std::string& path) -> connection_options {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    }
    catch (const YAML::Exception& e) {
        throw config_error("failed to load " + path + ": " + e.what());
    }

    auto options = load_connection_options(root);
    LOG(INFO) << "loaded connection options from " << path
              << ": read_buffer_size=" << options.read_buffer_size
              << " start_cancellable_operations=" << options.start_cancellable_operations
              << " socket_poll_interval_ms=" << options.socket_poll_interval.count();
    return options;
}
