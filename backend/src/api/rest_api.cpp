/**
 * RestApi: HTTP server for queue backfill, key directory and health.
 *
 * Runs on <bind_address>:<http_port> using ASIO. Each accepted socket
 * gets an HttpSession that reads the head, then the Content-Length
 * body, hands the request to the ApiRouter and writes the response.
 */

#include "api/rest_api.h"

#include <algorithm>
#include <istream>
#include <memory>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "api/api_router.h"
#include "api/http_message.h"

namespace {

constexpr std::size_t kMaxHeadBytes = 16 * 1024;

} // namespace

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(asio::ip::tcp::socket socket, ApiRouter& router, std::size_t max_body_bytes)
        : socket_(std::move(socket)),
          router_(router),
          max_body_bytes_(max_body_bytes),
          buffer_(kMaxHeadBytes + max_body_bytes) {}

    void start() { read_head(); }

    /// Drop the connection without answering.
    void abort() {
        if (socket_.is_open()) {
            close_socket();
        }
    }

private:
    void read_head() {
        auto self = shared_from_this();
        asio::async_read_until(socket_, buffer_, "\r\n\r\n",
            [this, self](const asio::error_code& ec, std::size_t n) {
                if (ec == asio::error::not_found) {
                    reply_error(413, "Request head too large");
                    return;
                }
                if (ec) {
                    if (ec != asio::error::eof) {
                        spdlog::debug("HTTP read failed: {}", ec.message());
                    }
                    return;
                }

                std::string head(asio::buffers_begin(buffer_.data()),
                                 asio::buffers_begin(buffer_.data()) + static_cast<std::ptrdiff_t>(n));
                buffer_.consume(n);

                try {
                    request_ = parse_request_head(head);
                    const std::size_t length = content_length(request_);
                    if (length > max_body_bytes_) {
                        reply_error(413, "Request body too large");
                        return;
                    }
                    read_body(length);
                } catch (const HttpError& e) {
                    reply_error(e.status(), e.what());
                }
            });
    }

    void read_body(std::size_t length) {
        if (buffer_.size() >= length) {
            finish_body(length);
            return;
        }
        auto self = shared_from_this();
        asio::async_read(socket_, buffer_, asio::transfer_exactly(length - buffer_.size()),
            [this, self, length](const asio::error_code& ec, std::size_t) {
                if (ec) {
                    spdlog::debug("HTTP body read failed: {}", ec.message());
                    return;
                }
                finish_body(length);
            });
    }

    void finish_body(std::size_t length) {
        request_.body.assign(asio::buffers_begin(buffer_.data()),
                             asio::buffers_begin(buffer_.data()) + static_cast<std::ptrdiff_t>(length));
        buffer_.consume(length);
        write(router_.handle(request_), request_.method != "HEAD");
    }

    void reply_error(int status, const std::string& message) {
        spdlog::warn("Rejecting HTTP request: {} {}", status, message);
        write(HttpResponse{status, nlohmann::json{{"error", message}}}, true);
    }

    void write(const HttpResponse& response, bool include_body) {
        out_ = serialize_response(response, include_body);
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(out_),
            [this, self](const asio::error_code& ec, std::size_t) {
                if (ec) {
                    spdlog::debug("HTTP write failed: {}", ec.message());
                }
                close_socket();
            });
    }

    void close_socket() {
        asio::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        if (ec && ec != asio::error::not_connected) {
            spdlog::debug("HTTP shutdown failed: {}", ec.message());
        }
        socket_.close(ec);
        if (ec) {
            spdlog::debug("HTTP close failed: {}", ec.message());
        }
    }

    asio::ip::tcp::socket socket_;
    ApiRouter& router_;
    std::size_t max_body_bytes_;
    asio::streambuf buffer_;
    HttpRequest request_;
    std::string out_;
};

RestApi::RestApi(asio::io_context& io,
                 const asio::ip::tcp::endpoint& endpoint,
                 ApiRouter& router,
                 std::size_t max_body_bytes)
    : acceptor_(io, endpoint), router_(router), max_body_bytes_(max_body_bytes) {}

void RestApi::start() {
    spdlog::info("HTTP API listening on {}:{}",
                 acceptor_.local_endpoint().address().to_string(), port());
    do_accept();
}

void RestApi::stop() {
    if (acceptor_.is_open()) {
        asio::error_code ec;
        acceptor_.close(ec);
        if (ec) {
            spdlog::warn("HTTP acceptor close failed: {}", ec.message());
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

uint16_t RestApi::port() const {
    return acceptor_.local_endpoint().port();
}

void RestApi::do_accept() {
    acceptor_.async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                spdlog::error("HTTP accept failed: {}", ec.message());
                do_accept();
            }
            return;
        }
        sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                       [](const std::weak_ptr<HttpSession>& w) { return w.expired(); }),
                        sessions_.end());

        auto session = std::make_shared<HttpSession>(std::move(socket), router_, max_body_bytes_);
        sessions_.push_back(session);
        session->start();
        do_accept();
    });
}
