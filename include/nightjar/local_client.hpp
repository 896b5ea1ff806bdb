/**
 * @file local_client.hpp
 * @brief Application client connections served by the bridge and relay
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include "nightjar/line_connection.hpp"
#include <string>
#include <memory>

namespace nightjar {

/// Reasons given when the server side closes a client
namespace close_reason {
    constexpr const char* TOO_MANY_CLIENTS = "too_many_clients";
    constexpr const char* AUTH_TIMEOUT = "Authentication timeout";
    constexpr const char* HEARTBEAT_TIMEOUT = "heartbeat_timeout";
    constexpr const char* SHUTDOWN = "shutdown";
}

/**
 * @brief Connection to one application client
 */
class LocalClient {
public:
    virtual ~LocalClient() = default;

    /**
     * @brief Deliver one JSON message
     */
    virtual bool send(const std::string& message) = 0;

    /**
     * @brief Disconnect, telling the client why when possible
     */
    virtual void close(const std::string& reason) = 0;
};

/**
 * @brief LocalClient over a newline-delimited JSON TCP connection
 *
 * close() sends an error message carrying the reason before closing.
 */
class LineClient : public LocalClient {
public:
    explicit LineClient(std::shared_ptr<LineConnection> connection);

    bool send(const std::string& message) override;
    void close(const std::string& reason) override;

    std::shared_ptr<LineConnection> get_connection() const { return connection_; }

private:
    std::shared_ptr<LineConnection> connection_;
};

} // namespace nightjar
