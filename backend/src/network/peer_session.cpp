/**
 * PeerSession: read/write loop for one relay client socket.
 */

#include "network/peer_session.h"

#include <iterator>
#include <utility>

#include <spdlog/spdlog.h>

std::string encode_frame(const std::string& payload) {
    const auto n = static_cast<uint32_t>(payload.size());
    std::string out;
    out.reserve(payload.size() + 4);
    out.push_back(static_cast<char>((n >> 24) & 0xFF));
    out.push_back(static_cast<char>((n >> 16) & 0xFF));
    out.push_back(static_cast<char>((n >> 8) & 0xFF));
    out.push_back(static_cast<char>(n & 0xFF));
    out += payload;
    return out;
}

PeerSession::PeerSession(asio::ip::tcp::socket socket,
                         RelayManager& relay,
                         std::size_t max_frame_bytes,
                         std::chrono::milliseconds auth_timeout)
    : socket_(std::move(socket)),
      relay_(relay),
      max_frame_bytes_(max_frame_bytes),
      auth_timeout_(auth_timeout),
      auth_timer_(socket_.get_executor()) {
    asio::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    peer_ = ec ? std::string("unknown")
               : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

void PeerSession::start() {
    relay_.on_open(shared_from_this(), ctx_);
    arm_auth_deadline();
    read_header();
}

void PeerSession::arm_auth_deadline() {
    auth_timer_.expires_after(auth_timeout_);
    auto self = shared_from_this();
    auth_timer_.async_wait([this, self](const asio::error_code& ec) {
        if (ec) return;
        if (ctx_.state == ConnectionState::Unauthenticated) {
            spdlog::warn("Connection {} did not authenticate within {}ms", peer_, auth_timeout_.count());
            abort();
        }
    });
}

void PeerSession::read_header() {
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(header_),
        [this, self](const asio::error_code& ec, std::size_t) {
            if (ec) {
                on_io_error(ec, "read");
                return;
            }
            const uint32_t length = (uint32_t(header_[0]) << 24) |
                                    (uint32_t(header_[1]) << 16) |
                                    (uint32_t(header_[2]) << 8)  |
                                     uint32_t(header_[3]);
            if (length == 0 || length > max_frame_bytes_) {
                spdlog::warn("Frame of {} bytes from {} rejected", length, peer_);
                shutdown_socket();
                return;
            }
            read_body(length);
        });
}

void PeerSession::read_body(uint32_t length) {
    body_.resize(length);
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(&body_[0], body_.size()),
        [this, self](const asio::error_code& ec, std::size_t) {
            if (ec) {
                on_io_error(ec, "read");
                return;
            }
            relay_.on_frame(self, ctx_, body_);
            // A rejected handshake stops the loop; the socket closes once
            // the error frame is flushed.
            if (!closing_ && socket_.is_open()) {
                read_header();
            }
        });
}

void PeerSession::send(const nlohmann::json& frame) {
    if (!is_open()) return;

    const bool idle = write_queue_.empty();
    write_queue_.push_back(encode_frame(frame.dump()));
    if (idle) {
        do_write();
    }
}

void PeerSession::do_write() {
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_queue_.front()),
        [this, self](const asio::error_code& ec, std::size_t) {
            if (ec) {
                write_queue_.clear();
                on_io_error(ec, "write");
                return;
            }
            write_queue_.pop_front();
            if (!write_queue_.empty()) {
                do_write();
            } else if (closing_) {
                shutdown_socket();
            }
        });
}

void PeerSession::close() {
    if (closing_) return;
    closing_ = true;
    if (write_queue_.empty()) {
        shutdown_socket();
    }
}

void PeerSession::abort() {
    // The front frame may still be referenced by an in-flight async_write.
    if (write_queue_.size() > 1) {
        write_queue_.erase(std::next(write_queue_.begin()), write_queue_.end());
    }
    shutdown_socket();
}

bool PeerSession::is_open() const {
    return !closing_ && socket_.is_open();
}

void PeerSession::on_io_error(const asio::error_code& ec, const char* what) {
    if (ec == asio::error::eof || ec == asio::error::operation_aborted) {
        spdlog::debug("Connection {} {} ended: {}", peer_, what, ec.message());
    } else {
        spdlog::warn("Connection {} {} error: {}", peer_, what, ec.message());
    }
    shutdown_socket();
}

void PeerSession::shutdown_socket() {
    closing_ = true;
    auth_timer_.cancel();
    if (socket_.is_open()) {
        asio::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        if (ec && ec != asio::error::not_connected) {
            spdlog::debug("Shutdown of {} failed: {}", peer_, ec.message());
        }
        socket_.close(ec);
        if (ec) {
            spdlog::debug("Close of {} failed: {}", peer_, ec.message());
        }
    }
    if (!notified_) {
        notified_ = true;
        relay_.on_close(shared_from_this(), ctx_);
    }
}
