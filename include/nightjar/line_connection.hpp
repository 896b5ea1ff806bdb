/**
 * @file line_connection.hpp
 * @brief Newline-delimited JSON framing over a TCP socket
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Shared by swarm peer connections and relay client connections.
 * All socket operations run on a per-connection strand. Outbound lines are
 * queued and written asynchronously, so send() and close() never block on
 * a peer that stops reading.
 */

#pragma once

#include "nightjar/mesh_config.hpp"
#include <asio.hpp>
#include <string>
#include <memory>
#include <deque>
#include <atomic>
#include <functional>

namespace nightjar {

class LineConnection : public std::enable_shared_from_this<LineConnection> {
public:
    /// Invoked for each complete line (without the trailing newline)
    using LineHandler = std::function<void(const std::string&)>;

    /// Invoked exactly once when the connection closes
    using CloseHandler = std::function<void(const std::string& reason)>;

    /**
     * @brief Wrap a connected socket
     * @param socket Connected socket
     * @param max_line_size Largest inbound line accepted
     * @param max_queued_bytes Outbound backlog at which the connection is dropped
     */
    LineConnection(asio::ip::tcp::socket socket, size_t max_line_size,
                   size_t max_queued_bytes = config::MAX_SEND_QUEUE_BYTES);

    ~LineConnection();

    // Disable copy and move
    LineConnection(const LineConnection&) = delete;
    LineConnection& operator=(const LineConnection&) = delete;
    LineConnection(LineConnection&&) = delete;
    LineConnection& operator=(LineConnection&&) = delete;

    /**
     * @brief Begin reading lines
     */
    void start(LineHandler on_line, CloseHandler on_close);

    /**
     * @brief Queue one line for writing (a newline is appended)
     * @return false if the connection is closed or its send queue is full
     */
    bool send(const std::string& line);

    /**
     * @brief Close the connection; the close handler runs once
     *
     * Lines already queued get up to CLOSE_LINGER to flush before the
     * socket is shut down.
     */
    void close(const std::string& reason);

    bool is_open() const { return open_; }

    /**
     * @brief Bytes queued but not yet written
     */
    size_t queued_bytes() const { return queued_bytes_; }

    /**
     * @brief "host:port" of the remote side, empty if unknown
     */
    std::string remote_address() const { return remote_address_; }

private:
    asio::ip::tcp::socket socket_;
    asio::strand<asio::ip::tcp::socket::executor_type> strand_;
    asio::steady_timer linger_timer_;
    asio::streambuf read_buffer_;
    std::string remote_address_;
    size_t max_queued_bytes_;

    LineHandler on_line_;
    CloseHandler on_close_;

    std::deque<std::shared_ptr<std::string>> write_queue_;  ///< Strand only
    bool closing_;                                          ///< Strand only
    std::atomic<size_t> queued_bytes_;
    std::atomic<bool> open_;
    std::atomic<bool> close_notified_;

    void read_next();
    void write_next();
    void begin_shutdown();
    void shutdown_socket();
    void notify_closed(const std::string& reason);
};

} // namespace nightjar
