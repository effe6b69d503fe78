#pragma once

#include <asio.hpp>
#include <cstdint>

#include "api/api_router.h"
#include "api/rest_api.h"
#include "config/relay_config.h"
#include "network/peer_server.h"
#include "relay/relay_manager.h"
#include "store/message_queue.h"
#include "store/public_key_store.h"

/**
 * The relay process: owns the stores, the relay manager, both listeners
 * and the periodic sweeps, all bound to one io_context.
 *
 * Components are built in dependency order in the constructor and torn
 * down in reverse by the destructor. Everything runs on the thread that
 * calls io_context::run().
 */
class RelayNode {
public:
    RelayNode(asio::io_context& io, const RelayConfig& config);

    RelayNode(const RelayNode&) = delete;
    RelayNode& operator=(const RelayNode&) = delete;

    /// Start listening, arm the timers and the SIGINT/SIGTERM handler.
    void start();

    /// Close listeners and every client socket, cancel timers, so that
    /// io_context::run() returns. Idempotent.
    void stop();

    /// Bound ports, valid until stop().
    [[nodiscard]] uint16_t socket_port() const { return peer_server_.port(); }
    [[nodiscard]] uint16_t http_port() const   { return rest_api_.port(); }

    [[nodiscard]] MessageQueue&   queue()  { return queue_; }
    [[nodiscard]] PublicKeyStore& keys()   { return keys_; }
    [[nodiscard]] RelayManager&   relay()  { return relay_; }

private:
    void schedule_heartbeat();
    void schedule_cleanup();

    RelayConfig    config_;
    MessageQueue   queue_;
    PublicKeyStore keys_;
    RelayManager   relay_;
    ApiRouter      router_;
    PeerServer     peer_server_;
    RestApi        rest_api_;

    asio::steady_timer heartbeat_timer_;
    asio::steady_timer cleanup_timer_;
    asio::signal_set   signals_;
    bool stopped_ = false;
};
