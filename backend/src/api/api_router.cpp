/**
 * ApiRouter: REST endpoints for queue inspection, public keys,
 * presence and health.
 *
 *   GET    /health
 *   GET    /api/messages/:address          drain, or ?limit=N to peek
 *                                           (HEAD never drains)
 *   GET    /api/messages/:address/queue-size
 *   DELETE /api/messages/:address
 *   GET    /api/messages/stats/all
 *   POST   /api/public-keys                { "address", "publicKey" }
 *   POST   /api/public-keys/batch          { "addresses": [...] }
 *   GET    /api/public-keys/:address
 *   HEAD   /api/public-keys/:address
 *   DELETE /api/public-keys/:address
 *   GET    /api/public-keys/stats/all
 *   GET    /api/status/:address
 *   POST   /api/status/batch               { "addresses": [...] }
 *   GET    /api/status/online/all
 *
 * HEAD falls back to the GET route when it has none of its own.
 */

#include "api/api_router.h"

#include <algorithm>
#include <cctype>
#include <utility>

#include <spdlog/spdlog.h>

#include "relay/address.h"
#include "relay/relay_manager.h"
#include "store/message_queue.h"
#include "store/public_key_store.h"

using json = nlohmann::json;

namespace {

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start < path.size()) {
        auto end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        if (end > start) out.push_back(path.substr(start, end - start));
        start = end + 1;
    }
    return out;
}

HttpResponse ok(json body) {
    return HttpResponse{200, std::move(body)};
}

/// Validated address parameter, or HttpError(400).
std::string require_address(const std::string& value) {
    if (!address::is_valid(value)) {
        throw HttpError(400, "Invalid address format");
    }
    return value;
}

json parse_body(const HttpRequest& request) {
    try {
        json body = json::parse(request.body);
        if (!body.is_object()) {
            throw HttpError(400, "Request body must be a JSON object");
        }
        return body;
    } catch (const json::parse_error&) {
        throw HttpError(400, "Invalid JSON body");
    }
}

/// Non-empty list of valid addresses from body["addresses"].
std::vector<std::string> require_address_list(const json& body) {
    auto it = body.find("addresses");
    if (it == body.end() || !it->is_array() || it->empty()) {
        throw HttpError(400, "addresses must be a non-empty array");
    }
    std::vector<std::string> out;
    out.reserve(it->size());
    for (const auto& entry : *it) {
        if (!entry.is_string() || !address::is_valid(entry.get<std::string>())) {
            throw HttpError(400, "Invalid address format: " + (entry.is_string() ? entry.get<std::string>() : entry.dump()));
        }
        out.push_back(entry.get<std::string>());
    }
    return out;
}

} // namespace

ApiRouter::ApiRouter(MessageQueue& queue, PublicKeyStore& keys, RelayManager& relay, Clock clock)
    : queue_(queue), keys_(keys), relay_(relay), clock_(std::move(clock)) {
    started_at_ms_ = clock_();
    routes_ = {
        {"GET",    {"health"},                                  &ApiRouter::health,           "Health check failed"},
        {"GET",    {"api", "messages", "stats", "all"},         &ApiRouter::message_stats,    "Failed to get statistics"},
        {"GET",    {"api", "messages", ":address"},             &ApiRouter::get_messages,     "Failed to retrieve messages"},
        {"GET",    {"api", "messages", ":address", "queue-size"}, &ApiRouter::get_queue_size, "Failed to get queue size"},
        {"DELETE", {"api", "messages", ":address"},             &ApiRouter::clear_messages,   "Failed to clear queue"},
        {"POST",   {"api", "public-keys"},                      &ApiRouter::store_key,        "Failed to store public key"},
        {"POST",   {"api", "public-keys", "batch"},             &ApiRouter::get_keys_batch,   "Failed to retrieve public keys"},
        {"GET",    {"api", "public-keys", "stats", "all"},      &ApiRouter::key_stats,        "Failed to get statistics"},
        {"GET",    {"api", "public-keys", ":address"},          &ApiRouter::get_key,          "Failed to retrieve public key"},
        {"HEAD",   {"api", "public-keys", ":address"},          &ApiRouter::head_key,         "Failed to check public key"},
        {"DELETE", {"api", "public-keys", ":address"},          &ApiRouter::delete_key,       "Failed to delete public key"},
        {"GET",    {"api", "status", "online", "all"},          &ApiRouter::get_online,       "Failed to get online users"},
        {"POST",   {"api", "status", "batch"},                  &ApiRouter::get_status_batch, "Failed to check statuses"},
        {"GET",    {"api", "status", ":address"},               &ApiRouter::get_status,       "Failed to check status"},
    };
}

const ApiRouter::Route* ApiRouter::find_route(const std::string& method,
                                              const std::vector<std::string>& segments,
                                              Params& params) const {
    for (const auto& route : routes_) {
        if (route.method != method || route.segments.size() != segments.size()) continue;

        params.clear();
        bool match = true;
        for (std::size_t i = 0; i < segments.size() && match; ++i) {
            const std::string& want = route.segments[i];
            if (!want.empty() && want[0] == ':') {
                params[want.substr(1)] = segments[i];
            } else {
                match = (want == segments[i]);
            }
        }
        if (match) return &route;
    }
    return nullptr;
}

HttpResponse ApiRouter::handle(const HttpRequest& request) {
    spdlog::info("{} {}", request.method, request.path);

    const auto segments = split_path(request.path);

    Params params;
    const Route* route = find_route(request.method, segments, params);
    // HEAD without a dedicated route answers like GET; the body is dropped
    // on the wire.
    if (route == nullptr && request.method == "HEAD") {
        route = find_route("GET", segments, params);
    }
    if (route == nullptr) {
        return HttpResponse{404, json{{"error", {{"message", "Endpoint not found"}, {"path", request.path}}}}};
    }

    try {
        return (this->*route->handler)(request, params);
    } catch (const HttpError& e) {
        return HttpResponse{e.status(), json{{"error", e.what()}}};
    } catch (const std::exception& e) {
        spdlog::error("{} {} failed: {}", request.method, request.path, e.what());
        return HttpResponse{500, json{{"error", route->failure}}};
    }
}

HttpResponse ApiRouter::health(const HttpRequest&, const Params&) {
    const int64_t now = clock_();
    return ok({
        {"status", "ok"},
        {"timestamp", now},
        {"uptime", static_cast<double>(now - started_at_ms_) / 1000.0},
        {"connections", relay_.connection_count()},
        {"queuedMessages", queue_.total_size()},
    });
}

HttpResponse ApiRouter::get_messages(const HttpRequest& request, const Params& params) {
    const std::string addr = require_address(params.at("address"));

    std::vector<QueuedMessage> messages;
    auto limit = request.query.find("limit");
    if (limit != request.query.end()) {
        const std::string& value = limit->second;
        if (value.empty() || value.size() > 9 ||
            !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw HttpError(400, "limit must be a non-negative integer");
        }
        messages = queue_.peek(addr, static_cast<std::size_t>(std::stoul(value)));
    } else if (request.method == "HEAD") {
        messages = queue_.peek(addr, queue_.queue_size(addr));
    } else {
        messages = queue_.dequeue(addr);
    }

    return ok({
        {"address", address::normalize(addr)},
        {"count", messages.size()},
        {"messages", messages},
    });
}

HttpResponse ApiRouter::get_queue_size(const HttpRequest&, const Params& params) {
    const std::string addr = require_address(params.at("address"));
    return ok({
        {"address", address::normalize(addr)},
        {"queueSize", queue_.queue_size(addr)},
    });
}

HttpResponse ApiRouter::clear_messages(const HttpRequest&, const Params& params) {
    const std::string addr = require_address(params.at("address"));
    const bool cleared = queue_.clear(addr);
    return ok({
        {"address", address::normalize(addr)},
        {"cleared", cleared},
        {"message", cleared ? "Queue cleared" : "No messages to clear"},
    });
}

HttpResponse ApiRouter::message_stats(const HttpRequest&, const Params&) {
    return ok(queue_.stats());
}

HttpResponse ApiRouter::store_key(const HttpRequest& request, const Params&) {
    const json body = parse_body(request);

    auto addr = body.find("address");
    if (addr == body.end() || !addr->is_string()) {
        throw HttpError(400, "Invalid address format");
    }
    require_address(addr->get<std::string>());

    auto key = body.find("publicKey");
    if (key == body.end() || !key->is_string() || key->get_ref<const std::string&>().empty()) {
        throw HttpError(400, "Invalid public key");
    }

    const PublicKeyRecord record = keys_.store(addr->get<std::string>(), key->get<std::string>());
    return ok({
        {"success", true},
        {"address", record.address},
        {"updatedAt", record.updated_at},
    });
}

HttpResponse ApiRouter::get_key(const HttpRequest&, const Params& params) {
    const auto record = keys_.get(require_address(params.at("address")));
    if (!record) {
        return HttpResponse{404, json{{"error", "Public key not found for this address"}}};
    }
    return ok(*record);
}

HttpResponse ApiRouter::head_key(const HttpRequest&, const Params& params) {
    const bool found = keys_.exists(require_address(params.at("address")));
    return HttpResponse{found ? 200 : 404, json()};
}

HttpResponse ApiRouter::get_keys_batch(const HttpRequest& request, const Params&) {
    const auto addrs = require_address_list(parse_body(request));
    const auto found = keys_.get_multiple(addrs);

    json keys = json::object();
    for (const auto& entry : found) {
        keys[entry.first] = entry.second;
    }
    return ok({
        {"count", found.size()},
        {"keys", keys},
    });
}

HttpResponse ApiRouter::delete_key(const HttpRequest&, const Params& params) {
    const bool deleted = keys_.remove(require_address(params.at("address")));
    return ok({
        {"success", deleted},
        {"message", deleted ? "Public key deleted" : "Public key not found"},
    });
}

HttpResponse ApiRouter::key_stats(const HttpRequest&, const Params&) {
    return ok({
        {"totalKeys", keys_.count()},
        {"addresses", keys_.addresses()},
    });
}

HttpResponse ApiRouter::get_status(const HttpRequest&, const Params& params) {
    const std::string addr = require_address(params.at("address"));
    return ok({
        {"address", address::normalize(addr)},
        {"online", relay_.is_online(addr)},
        {"timestamp", clock_()},
    });
}

HttpResponse ApiRouter::get_status_batch(const HttpRequest& request, const Params&) {
    const auto addrs = require_address_list(parse_body(request));

    json statuses = json::object();
    for (const auto& addr : addrs) {
        statuses[address::normalize(addr)] = relay_.is_online(addr);
    }
    return ok({
        {"timestamp", clock_()},
        {"statuses", statuses},
    });
}

HttpResponse ApiRouter::get_online(const HttpRequest&, const Params&) {
    const auto users = relay_.online_addresses();
    return ok({
        {"count", users.size()},
        {"users", users},
        {"timestamp", clock_()},
    });
}
