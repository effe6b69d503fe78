#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "relay/clock.h"
#include "relay/frame.h"
#include "relay/session.h"

class MessageQueue;

enum class ConnectionState {
    Unauthenticated = 0,
    Authenticated   = 1,
    Closed          = 2,
};

/// Per-socket protocol state, owned by the socket's read loop.
struct ConnectionContext {
    ConnectionState state = ConnectionState::Unauthenticated;
    std::string     address;   ///< set once authenticated
};

/**
 * Connection registry and message router.
 *
 * Owns the address → session map. Frames from a socket are handed in
 * one at a time by that socket's read loop; each call runs to
 * completion on the io thread, so registry mutations never interleave.
 *
 * A second registration for an address replaces the first entry. The
 * displaced session is neither notified nor closed.
 */
class RelayManager {
public:
    explicit RelayManager(MessageQueue& queue, Clock clock = system_now_ms);

    RelayManager(const RelayManager&) = delete;
    RelayManager& operator=(const RelayManager&) = delete;

    /// Called once per accepted socket.
    void on_open(const std::shared_ptr<Session>& session, ConnectionContext& ctx);

    /// Process one raw inbound frame from `session`.
    void on_frame(const std::shared_ptr<Session>& session,
                  ConnectionContext& ctx,
                  const std::string& raw);

    /// Socket closed by either side.
    void on_close(const std::shared_ptr<Session>& session, ConnectionContext& ctx);

    /// Close and unregister every session idle for longer than `timeout_ms`
    /// at time `now_ms`. Returns how many were evicted.
    std::size_t sweep_stale(int64_t now_ms, int64_t timeout_ms);

    /// Close every registered session and empty the registry.
    void close_all();

    [[nodiscard]] bool is_online(const std::string& addr) const;
    [[nodiscard]] std::size_t connection_count() const { return connections_.size(); }
    [[nodiscard]] std::vector<std::string> online_addresses() const;

    /// Last activity of a registered address, or -1.
    [[nodiscard]] int64_t last_activity(const std::string& addr) const;

private:
    struct Connection {
        std::shared_ptr<Session> session;
        int64_t last_activity_ms = 0;
    };

    using StateHandler = void (RelayManager::*)(const std::shared_ptr<Session>&,
                                                ConnectionContext&,
                                                const InboundFrame&);

    // Unauthenticated, Authenticated. Closed sockets never dispatch.
    static const std::array<StateHandler, 2> kDispatch;

    void handle_unauthenticated(const std::shared_ptr<Session>& session,
                                ConnectionContext& ctx,
                                const InboundFrame& frame);
    void handle_authenticated(const std::shared_ptr<Session>& session,
                              ConnectionContext& ctx,
                              const InboundFrame& frame);

    void reject_unauthenticated(Session& session, ConnectionContext& ctx);

    void handle_message(Session& sender, const std::string& from, const ChatFrame& frame);
    void handle_typing(const std::string& from, const TypingFrame& frame);
    void handle_read_receipt(const std::string& from, const ReadReceiptFrame& frame);
    void deliver_queued(Session& session, const std::string& addr);

    /// Registered and open session for `addr`, or nullptr.
    Session* open_session(const std::string& addr) const;

    void broadcast_status(const std::string& addr, const char* status) const;

    MessageQueue& queue_;
    Clock clock_;
    std::unordered_map<std::string, Connection> connections_;
};
