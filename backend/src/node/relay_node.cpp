/**
 * RelayNode: wires the relay together and drives its timers.
 *
 * Heartbeat: every heartbeat_interval, sessions idle for longer than
 * heartbeat_timeout are evicted. Cleanup: every cleanup_interval, queued
 * messages past the retention window are purged.
 */

#include "node/relay_node.h"

#include <chrono>
#include <csignal>
#include <string>

#include <spdlog/spdlog.h>

#include "relay/clock.h"

namespace {

asio::ip::tcp::endpoint make_endpoint(const std::string& host, uint16_t port) {
    asio::error_code ec;
    const auto addr = asio::ip::make_address(host, ec);
    if (ec) {
        throw ConfigError("Invalid bind_address '" + host + "': " + ec.message());
    }
    return {addr, port};
}

} // namespace

RelayNode::RelayNode(asio::io_context& io, const RelayConfig& config)
    : config_(config),
      queue_(config.max_offline_messages, config.message_retention_hours),
      relay_(queue_),
      router_(queue_, keys_, relay_),
      peer_server_(io, make_endpoint(config.bind_address, config.socket_port), relay_, config.max_frame_bytes,
                   std::chrono::seconds(config.heartbeat_timeout_seconds)),
      rest_api_(io, make_endpoint(config.bind_address, config.http_port), router_, config.max_frame_bytes),
      heartbeat_timer_(io),
      cleanup_timer_(io),
      signals_(io, SIGINT, SIGTERM) {}

void RelayNode::start() {
    peer_server_.start();
    rest_api_.start();
    schedule_heartbeat();
    schedule_cleanup();

    spdlog::info("Message queue cleanup every {}s, retention {}h",
                 config_.cleanup_interval_seconds, config_.message_retention_hours);

    signals_.async_wait([this](const asio::error_code& ec, int signo) {
        if (ec) return;
        spdlog::info("Signal {} received, shutting down", signo);
        stop();
    });
}

void RelayNode::stop() {
    if (stopped_) return;
    stopped_ = true;

    relay_.close_all();
    peer_server_.stop();
    rest_api_.stop();

    heartbeat_timer_.cancel();
    cleanup_timer_.cancel();
    signals_.cancel();
    spdlog::info("Relay stopped");
}

void RelayNode::schedule_heartbeat() {
    heartbeat_timer_.expires_after(std::chrono::seconds(config_.heartbeat_interval_seconds));
    heartbeat_timer_.async_wait([this](const asio::error_code& ec) {
        if (ec) return;
        relay_.sweep_stale(system_now_ms(), config_.heartbeat_timeout_seconds * 1000);
        schedule_heartbeat();
    });
}

void RelayNode::schedule_cleanup() {
    cleanup_timer_.expires_after(std::chrono::seconds(config_.cleanup_interval_seconds));
    cleanup_timer_.async_wait([this](const asio::error_code& ec) {
        if (ec) return;
        queue_.cleanup(system_now_ms());
        schedule_cleanup();
    });
}
