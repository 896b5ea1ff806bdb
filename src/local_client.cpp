/**
 * @file local_client.cpp
 * @brief TCP adapter for application client connections
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "nightjar/local_client.hpp"
#include "nightjar/message_types.hpp"

namespace nightjar {

LineClient::LineClient(std::shared_ptr<LineConnection> connection)
    : connection_(std::move(connection))
{
}

bool LineClient::send(const std::string& message) {
    return connection_->send(message);
}

void LineClient::close(const std::string& reason) {
    if (connection_->is_open()) {
        connection_->send(ErrorMessage{reason, "connection closed"}.to_json());
    }
    connection_->close(reason);
}

} // namespace nightjar
