#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Runtime settings for the relay node.
 *
 * Read from the "relay" object of a JSON config file, then overridden
 * by environment variables (PORT, SOCKET_PORT, MAX_OFFLINE_MESSAGES,
 * MESSAGE_RETENTION_HOURS, LOG_LEVEL).
 */
struct RelayConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t    http_port    = 3000;
    uint16_t    socket_port  = 3001;

    std::size_t max_offline_messages    = 1000;
    int64_t     message_retention_hours = 168;
    int64_t     cleanup_interval_seconds   = 3600;
    int64_t     heartbeat_interval_seconds = 30;
    int64_t     heartbeat_timeout_seconds  = 60;
    std::size_t max_frame_bytes = 1024 * 1024;

    std::string log_level = "info";

    /// Throws ConfigError when a value is out of range.
    void validate() const;
};

/// Overlay the "relay" object of `doc` onto `config`.
void apply_json(RelayConfig& config, const nlohmann::json& doc);

/// Overlay environment variables onto `config`.
void apply_env(RelayConfig& config);

/// Defaults, then `path` if it exists, then the environment. Validated.
RelayConfig load_config(const std::string& path);
