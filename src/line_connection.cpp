/**
 * @file line_connection.cpp
 * @brief Implementation of newline-delimited framing
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "nightjar/line_connection.hpp"
#include "nightjar/utilities.hpp"
#include <istream>

namespace nightjar {

LineConnection::LineConnection(asio::ip::tcp::socket socket, size_t max_line_size,
                               size_t max_queued_bytes)
    : socket_(std::move(socket))
    , strand_(asio::make_strand(socket_.get_executor()))
    , linger_timer_(strand_)
    , read_buffer_(max_line_size)
    , max_queued_bytes_(max_queued_bytes)
    , closing_(false)
    , queued_bytes_(0)
    , open_(true)
    , close_notified_(false)
{
    asio::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (!ec) {
        remote_address_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }
}

LineConnection::~LineConnection() {
    asio::error_code ec;
    socket_.close(ec);
}

void LineConnection::start(LineHandler on_line, CloseHandler on_close) {
    on_line_ = std::move(on_line);
    on_close_ = std::move(on_close);

    auto self = shared_from_this();
    asio::post(strand_, [this, self]() { read_next(); });
}

// ============================================================================
// READING
// ============================================================================

void LineConnection::read_next() {
    auto self = shared_from_this();

    asio::async_read_until(socket_, read_buffer_, '\n', asio::bind_executor(strand_,
        [this, self](const asio::error_code& error, std::size_t /*bytes_transferred*/) {
            if (error) {
                // streambuf max_size reached surfaces as not_found
                std::string reason = error == asio::error::not_found
                    ? "message too large"
                    : (error == asio::error::eof ? "connection closed" : error.message());
                close(reason);
                return;
            }

            std::istream stream(&read_buffer_);
            std::string line;
            std::getline(stream, line);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }

            if (!line.empty() && on_line_) {
                try {
                    on_line_(line);
                } catch (const std::exception& e) {
                    utilities::log_error("LineConnection: Handler error from " + remote_address_ +
                                         ": " + e.what());
                }
            }

            if (open_) {
                read_next();
            }
        }));
}

// ============================================================================
// WRITING
// ============================================================================

bool LineConnection::send(const std::string& line) {
    if (!open_) {
        return false;
    }

    auto framed = std::make_shared<std::string>(line);
    framed->push_back('\n');

    size_t pending = queued_bytes_.fetch_add(framed->size()) + framed->size();
    if (pending > max_queued_bytes_) {
        queued_bytes_ -= framed->size();
        utilities::log_warn("LineConnection: Send queue to " + remote_address_ + " exceeded " +
                            utilities::format_file_size(max_queued_bytes_) + ", dropping connection");
        close("send queue full");
        return false;
    }

    auto self = shared_from_this();
    asio::post(strand_, [this, self, framed]() {
        if (closing_ || !socket_.is_open()) {
            queued_bytes_ -= framed->size();
            return;
        }
        write_queue_.push_back(framed);
        if (write_queue_.size() == 1) {
            write_next();
        }
    });
    return true;
}

void LineConnection::write_next() {
    auto self = shared_from_this();

    asio::async_write(socket_, asio::buffer(*write_queue_.front()), asio::bind_executor(strand_,
        [this, self](const asio::error_code& error, std::size_t /*bytes_transferred*/) {
            queued_bytes_ -= write_queue_.front()->size();
            write_queue_.pop_front();

            if (error) {
                utilities::log_debug("LineConnection: Write to " + remote_address_ + " failed: " +
                                     error.message());
                for (const auto& pending : write_queue_) {
                    queued_bytes_ -= pending->size();
                }
                write_queue_.clear();
                close(error == asio::error::operation_aborted ? "connection closed" : error.message());
                shutdown_socket();
                return;
            }

            if (!write_queue_.empty()) {
                write_next();
            } else if (closing_) {
                shutdown_socket();
            }
        }));
}

// ============================================================================
// CLOSING
// ============================================================================

void LineConnection::close(const std::string& reason) {
    if (open_.exchange(false)) {
        auto self = shared_from_this();
        asio::post(strand_, [this, self]() { begin_shutdown(); });
    }
    notify_closed(reason);
}

void LineConnection::begin_shutdown() {
    if (closing_) {
        return;
    }
    closing_ = true;

    if (write_queue_.empty()) {
        shutdown_socket();
        return;
    }

    // Give queued lines (an error or close reason) a bounded chance to flush
    auto self = shared_from_this();
    linger_timer_.expires_after(config::CLOSE_LINGER);
    linger_timer_.async_wait(asio::bind_executor(strand_, [this, self](const asio::error_code& error) {
        if (!error) {
            shutdown_socket();
        }
    }));
}

void LineConnection::shutdown_socket() {
    closing_ = true;
    linger_timer_.cancel();

    if (socket_.is_open()) {
        asio::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }
}

void LineConnection::notify_closed(const std::string& reason) {
    // Not started yet: the failing first read reports the close instead
    if (!on_close_ || close_notified_.exchange(true)) {
        return;
    }

    try {
        on_close_(reason);
    } catch (const std::exception& e) {
        utilities::log_error("LineConnection: Close handler error: " + std::string(e.what()));
    }
}

} // namespace nightjar
