#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "api/http_message.h"
#include "relay/clock.h"

class MessageQueue;
class PublicKeyStore;
class RelayManager;

/**
 * Route table for the relay's REST API.
 *
 * Pure request → response; no sockets involved. Every handler validates
 * address parameters before touching a store.
 */
class ApiRouter {
public:
    ApiRouter(MessageQueue& queue,
              PublicKeyStore& keys,
              RelayManager& relay,
              Clock clock = system_now_ms);

    HttpResponse handle(const HttpRequest& request);

private:
    using Params  = std::map<std::string, std::string>;
    using Handler = HttpResponse (ApiRouter::*)(const HttpRequest&, const Params&);

    struct Route {
        std::string method;
        std::vector<std::string> segments;   ///< ":name" captures one segment
        Handler handler;
        const char* failure;                 ///< body of a 500 for this route
    };

    /// First route matching `method` and `segments`; fills `params`.
    const Route* find_route(const std::string& method,
                            const std::vector<std::string>& segments,
                            Params& params) const;

    HttpResponse health(const HttpRequest&, const Params&);

    HttpResponse get_messages(const HttpRequest&, const Params&);
    HttpResponse get_queue_size(const HttpRequest&, const Params&);
    HttpResponse clear_messages(const HttpRequest&, const Params&);
    HttpResponse message_stats(const HttpRequest&, const Params&);

    HttpResponse store_key(const HttpRequest&, const Params&);
    HttpResponse get_key(const HttpRequest&, const Params&);
    HttpResponse head_key(const HttpRequest&, const Params&);
    HttpResponse get_keys_batch(const HttpRequest&, const Params&);
    HttpResponse delete_key(const HttpRequest&, const Params&);
    HttpResponse key_stats(const HttpRequest&, const Params&);

    HttpResponse get_status(const HttpRequest&, const Params&);
    HttpResponse get_status_batch(const HttpRequest&, const Params&);
    HttpResponse get_online(const HttpRequest&, const Params&);

    MessageQueue&   queue_;
    PublicKeyStore& keys_;
    RelayManager&   relay_;
    Clock           clock_;
    int64_t         started_at_ms_;
    std::vector<Route> routes_;
};
