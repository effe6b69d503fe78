/**
 * RelayConfig loading: JSON file, then environment overrides.
 */

#include "config/relay_config.h"

#include <cstdlib>
#include <fstream>
#include <limits>

#include <spdlog/spdlog.h>

#include "store/message_queue.h"

using json = nlohmann::json;

namespace {

constexpr int64_t kMaxCleanupIntervalSeconds  = 7 * 24 * 3600;
constexpr int64_t kMaxHeartbeatSeconds        = 24 * 3600;
constexpr std::size_t kMaxFrameBytesLimit     = 64 * 1024 * 1024;

void check_range(const char* name, int64_t value, int64_t max) {
    if (value <= 0 || value > max) {
        throw ConfigError(std::string(name) + " must be in 1.." + std::to_string(max));
    }
}

template <typename T>
void read_number(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    if (!it->is_number_integer()) {
        throw ConfigError(std::string("relay.") + key + " must be an integer");
    }
    const auto value = it->get<int64_t>();
    if (value < 0 || static_cast<uint64_t>(value) > std::numeric_limits<T>::max()) {
        throw ConfigError(std::string("relay.") + key + " is out of range");
    }
    out = static_cast<T>(value);
}

void read_string(const json& obj, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    if (!it->is_string()) {
        throw ConfigError(std::string("relay.") + key + " must be a string");
    }
    out = it->get<std::string>();
}

template <typename T>
void read_env_number(const char* name, T& out) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') return;

    char* end = nullptr;
    const long long value = std::strtoll(raw, &end, 10);
    if (*end != '\0' || value < 0 ||
        static_cast<unsigned long long>(value) > std::numeric_limits<T>::max()) {
        throw ConfigError(std::string("Invalid value for ") + name + ": " + raw);
    }
    out = static_cast<T>(value);
}

} // namespace

void RelayConfig::validate() const {
    if (max_offline_messages == 0) throw ConfigError("max_offline_messages must be positive");
    check_range("message_retention_hours", message_retention_hours, MessageQueue::kMaxRetentionHours);
    check_range("cleanup_interval_seconds", cleanup_interval_seconds, kMaxCleanupIntervalSeconds);
    check_range("heartbeat_interval_seconds", heartbeat_interval_seconds, kMaxHeartbeatSeconds);
    check_range("heartbeat_timeout_seconds", heartbeat_timeout_seconds, kMaxHeartbeatSeconds);
    if (max_frame_bytes == 0 || max_frame_bytes > kMaxFrameBytesLimit) {
        throw ConfigError("max_frame_bytes must be in 1.." + std::to_string(kMaxFrameBytesLimit));
    }
    if (spdlog::level::from_str(log_level) == spdlog::level::off && log_level != "off") {
        throw ConfigError("Unknown log level: " + log_level);
    }
}

void apply_json(RelayConfig& config, const json& doc) {
    auto it = doc.find("relay");
    if (it == doc.end()) return;
    if (!it->is_object()) throw ConfigError("\"relay\" must be an object");

    const json& relay = *it;
    read_string(relay, "bind_address", config.bind_address);
    read_number(relay, "http_port", config.http_port);
    read_number(relay, "socket_port", config.socket_port);
    read_number(relay, "max_offline_messages", config.max_offline_messages);
    read_number(relay, "message_retention_hours", config.message_retention_hours);
    read_number(relay, "cleanup_interval_seconds", config.cleanup_interval_seconds);
    read_number(relay, "heartbeat_interval_seconds", config.heartbeat_interval_seconds);
    read_number(relay, "heartbeat_timeout_seconds", config.heartbeat_timeout_seconds);
    read_number(relay, "max_frame_bytes", config.max_frame_bytes);
    read_string(relay, "log_level", config.log_level);
}

void apply_env(RelayConfig& config) {
    read_env_number("PORT", config.http_port);
    read_env_number("SOCKET_PORT", config.socket_port);
    read_env_number("MAX_OFFLINE_MESSAGES", config.max_offline_messages);
    read_env_number("MESSAGE_RETENTION_HOURS", config.message_retention_hours);
    if (const char* level = std::getenv("LOG_LEVEL")) {
        if (*level != '\0') config.log_level = level;
    }
}

RelayConfig load_config(const std::string& path) {
    RelayConfig config;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            apply_json(config, json::parse(file));
        } catch (const json::parse_error& e) {
            throw ConfigError("Cannot parse " + path + ": " + e.what());
        }
        spdlog::info("Loaded config from {}", path);
    } else {
        spdlog::warn("Config file {} not found, using defaults", path);
    }

    apply_env(config);
    config.validate();
    return config;
}
