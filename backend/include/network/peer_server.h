#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

class PeerSession;
class RelayManager;

/**
 * Async TCP server that accepts relay client connections.
 *
 * Keeps a weak reference to every session it spawned so stop() can abort
 * sockets the relay does not know about (unauthenticated or displaced).
 */
class PeerServer {
public:
    PeerServer(asio::io_context& io,
               const asio::ip::tcp::endpoint& endpoint,
               RelayManager& relay,
               std::size_t max_frame_bytes,
               std::chrono::milliseconds auth_timeout);

    void start();

    /// Close the acceptor and abort every live session.
    void stop();

    /// Bound port; differs from the configured one when that was 0.
    [[nodiscard]] uint16_t port() const;

private:
    void do_accept();

    asio::ip::tcp::acceptor acceptor_;
    RelayManager& relay_;
    std::size_t max_frame_bytes_;
    std::chrono::milliseconds auth_timeout_;
    std::vector<std::weak_ptr<PeerSession>> sessions_;
};
