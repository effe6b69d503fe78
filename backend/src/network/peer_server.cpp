/**
 * PeerServer: Listens for incoming relay client connections.
 *
 * Uses standalone ASIO for async I/O.
 * Each connected client gets its own PeerSession that reads
 * length-prefixed JSON frames off the wire.
 */

#include "network/peer_server.h"

#include <algorithm>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

#include "network/peer_session.h"
#include "relay/relay_manager.h"

PeerServer::PeerServer(asio::io_context& io,
                       const asio::ip::tcp::endpoint& endpoint,
                       RelayManager& relay,
                       std::size_t max_frame_bytes,
                       std::chrono::milliseconds auth_timeout)
    : acceptor_(io, endpoint),
      relay_(relay),
      max_frame_bytes_(max_frame_bytes),
      auth_timeout_(auth_timeout) {}

void PeerServer::start() {
    spdlog::info("Socket server listening on {}:{}",
                 acceptor_.local_endpoint().address().to_string(), port());
    do_accept();
}

void PeerServer::stop() {
    if (acceptor_.is_open()) {
        asio::error_code ec;
        acceptor_.close(ec);
        if (ec) {
            spdlog::warn("Socket acceptor close failed: {}", ec.message());
        }
    }

    auto sessions = std::move(sessions_);
    sessions_.clear();
    for (auto& weak : sessions) {
        if (auto session = weak.lock()) {
            session->abort();
        }
    }
}

uint16_t PeerServer::port() const {
    return acceptor_.local_endpoint().port();
}

void PeerServer::do_accept() {
    acceptor_.async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                spdlog::error("Accept failed: {}", ec.message());
                do_accept();
            }
            return;
        }
        sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                       [](const std::weak_ptr<PeerSession>& w) { return w.expired(); }),
                        sessions_.end());

        auto session = std::make_shared<PeerSession>(
            std::move(socket), relay_, max_frame_bytes_, auth_timeout_);
        sessions_.push_back(session);
        session->start();
        do_accept();
    });
}
