/**
 * @file utilities.hpp
 * @brief Common utility functions for Nightjar
 *
 * Nightjar Mesh - Encrypted Peer-to-Peer Chunk Distribution
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout Nightjar:
 * - Logging and error reporting
 * - Time and size formatting
 * - String manipulation
 * - File I/O and hashing helpers
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace nightjar {
namespace utilities {

/**
 * @brief Log levels for Nightjar logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to log file (empty for stdout only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Parse a log level name ("debug", "info", "warn", "error", "critical")
 * @param name Level name, case-insensitive
 * @return Matching level, or LogLevel::INFO if unknown
 */
LogLevel parse_log_level(const std::string& name);

/**
 * @brief Log a message with specified level
 * @param level Log level
 * @param message Message to log
 */
void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

// ============================================================================
// Time and formatting
// ============================================================================

/**
 * @brief Current wall-clock time in milliseconds since epoch
 */
uint64_t current_time_ms();

/**
 * @brief Format byte count in human-readable form ("1.5 MB")
 */
std::string format_file_size(uint64_t size);

/**
 * @brief Format duration in human-readable form ("2h 15m 30s")
 */
std::string format_duration(uint64_t seconds);

/**
 * @brief Shorten a hex key for log output ("a1b2c3d4...")
 */
std::string short_id(const std::string& id, size_t length = 8);

// ============================================================================
// Files and hashing
// ============================================================================

/**
 * @brief Read entire file into byte vector
 * @param file_path Path to file
 * @return File contents or std::nullopt if error
 */
std::optional<std::vector<uint8_t>> read_file_binary(const std::string& file_path);

/**
 * @brief Write byte vector to file, creating parent directories
 * @return true if successful, false otherwise
 */
bool write_file_binary(const std::string& file_path, const std::vector<uint8_t>& content);

/**
 * @brief SHA-256 of a string as lowercase hex
 */
std::string sha256_hex(const std::string& data);

/**
 * @brief SHA-256 of a byte buffer as lowercase hex
 */
std::string sha256_hex(const std::vector<uint8_t>& data);

// ============================================================================
// Strings and environment
// ============================================================================

std::vector<std::string> split_string(const std::string& str, char delimiter);

std::string trim_string(const std::string& str);

std::string to_lowercase(const std::string& str);

bool starts_with(const std::string& str, const std::string& prefix);

/**
 * @brief Decode %XX escapes (and '+' left as-is)
 */
std::string url_decode(const std::string& str);

/**
 * @brief Percent-encode everything outside the unreserved set
 */
std::string url_encode(const std::string& str);

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set
 * @return Environment variable value or default
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

/**
 * @brief Generate random alphanumeric string
 */
std::string generate_random_string(size_t length);

} // namespace utilities
} // namespace nightjar
