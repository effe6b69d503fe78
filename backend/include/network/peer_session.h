#pragma once

#include <asio.hpp>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>

#include "relay/relay_manager.h"
#include "relay/session.h"

/**
 * One client socket.
 *
 * Reads length-prefixed JSON frames (4-byte big-endian length, then the
 * body) one at a time and hands each to the RelayManager before reading
 * the next, so frames from one client are processed in arrival order.
 * Outbound frames go through a write queue drained one async_write at a
 * time.
 *
 * A socket that has not authenticated within `auth_timeout` is aborted.
 */
class PeerSession : public Session,
                    public std::enable_shared_from_this<PeerSession> {
public:
    PeerSession(asio::ip::tcp::socket socket,
                RelayManager& relay,
                std::size_t max_frame_bytes,
                std::chrono::milliseconds auth_timeout);

    void start();

    void send(const nlohmann::json& frame) override;
    void close() override;
    void abort() override;
    [[nodiscard]] bool is_open() const override;
    [[nodiscard]] std::string peer() const override { return peer_; }

private:
    void arm_auth_deadline();
    void read_header();
    void read_body(uint32_t length);
    void do_write();
    void on_io_error(const asio::error_code& ec, const char* what);
    void shutdown_socket();

    asio::ip::tcp::socket socket_;
    RelayManager& relay_;
    ConnectionContext ctx_;
    std::size_t max_frame_bytes_;
    std::chrono::milliseconds auth_timeout_;
    asio::steady_timer auth_timer_;
    std::string peer_;

    std::array<uint8_t, 4> header_{};
    std::string body_;
    std::deque<std::string> write_queue_;

    bool closing_  = false;  ///< no more writes accepted; socket closes once the queue drains
    bool notified_ = false;  ///< relay has seen on_close
};

/// Encode `payload` with its 4-byte big-endian length prefix.
std::string encode_frame(const std::string& payload);
