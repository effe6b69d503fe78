#pragma once

#include <asio.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

class ApiRouter;
class HttpSession;

/**
 * Minimal HTTP/1.1 server for the relay's REST API.
 *
 * One request per connection; the response always carries
 * "Connection: close".
 */
class RestApi {
public:
    RestApi(asio::io_context& io,
            const asio::ip::tcp::endpoint& endpoint,
            ApiRouter& router,
            std::size_t max_body_bytes);

    void start();

    /// Close the acceptor and abort every in-flight request.
    void stop();

    [[nodiscard]] uint16_t port() const;

private:
    void do_accept();

    asio::ip::tcp::acceptor acceptor_;
    ApiRouter& router_;
    std::size_t max_body_bytes_;
    std::vector<std::weak_ptr<HttpSession>> sessions_;
};
