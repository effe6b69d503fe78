#pragma once

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

/// A parsed HTTP/1.1 request. Header names are lower-cased.
struct HttpRequest {
    std::string method;
    std::string target;
    std::string path;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse {
    int            status = 200;
    nlohmann::json body;   ///< null means no body
};

/// A request that cannot be served; carries the status to answer with.
class HttpError : public std::runtime_error {
public:
    HttpError(int status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    [[nodiscard]] int status() const { return status_; }

private:
    int status_;
};

/// Parse the request line and headers, up to and including the blank
/// line. Throws HttpError(400) on malformed input.
HttpRequest parse_request_head(const std::string& head);

/// Declared body length; 0 when absent. Throws HttpError(400) if invalid.
std::size_t content_length(const HttpRequest& request);

/// Percent-decode one URL component ('+' is left as is).
std::string url_decode(const std::string& text);

/// Full response bytes. The body is omitted when `include_body` is false.
std::string serialize_response(const HttpResponse& response, bool include_body);

const char* status_reason(int status);
