/**
 * Just enough HTTP/1.1 to serve the relay's JSON API: request line,
 * headers, Content-Length bodies, and Connection: close responses.
 */

#include "api/http_message.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void parse_query(const std::string& text, std::map<std::string, std::string>& out) {
    std::size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find('&', start);
        if (end == std::string::npos) end = text.size();
        const std::string pair = text.substr(start, end - start);
        if (!pair.empty()) {
            const auto eq = pair.find('=');
            if (eq == std::string::npos) {
                out[url_decode(pair)] = "";
            } else {
                out[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
            }
        }
        start = end + 1;
    }
}

} // namespace

std::string url_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int hi = hex_value(text[i + 1]);
            const int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

HttpRequest parse_request_head(const std::string& head) {
    std::istringstream in(head);
    std::string line;
    if (!std::getline(in, line)) {
        throw HttpError(400, "Empty request");
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();

    HttpRequest req;
    std::string version;
    std::istringstream request_line(line);
    if (!(request_line >> req.method >> req.target >> version) ||
        version.compare(0, 5, "HTTP/") != 0 || req.target.empty() || req.target[0] != '/') {
        throw HttpError(400, "Malformed request line");
    }

    const auto qmark = req.target.find('?');
    req.path = url_decode(req.target.substr(0, qmark));
    if (qmark != std::string::npos) {
        parse_query(req.target.substr(qmark + 1), req.query);
    }

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;
        const auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            throw HttpError(400, "Malformed header");
        }
        req.headers[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return req;
}

std::size_t content_length(const HttpRequest& request) {
    auto it = request.headers.find("content-length");
    if (it == request.headers.end()) return 0;
    const std::string& value = it->second;
    if (value.empty() || value.size() > 12 ||
        !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw HttpError(400, "Invalid Content-Length");
    }
    return static_cast<std::size_t>(std::stoull(value));
}

const char* status_reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
    }
}

std::string serialize_response(const HttpResponse& response, bool include_body) {
    const std::string body = response.body.is_null() ? std::string() : response.body.dump();

    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << ' ' << status_reason(response.status) << "\r\n";
    if (!body.empty()) {
        out << "Content-Type: application/json; charset=utf-8\r\n";
    }
    out << "Content-Length: " << body.size() << "\r\n";
    out << "Connection: close\r\n\r\n";
    if (include_body) {
        out << body;
    }
    return out.str();
}
