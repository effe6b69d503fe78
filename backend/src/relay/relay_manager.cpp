/**
 * RelayManager: connection registry, auth gate and message router.
 *
 * Frames are dispatched through a table indexed by connection state:
 *   Unauthenticated  only an "auth" frame is accepted, anything else
 *                    closes the socket
 *   Authenticated    message / typing / read_receipt / ping
 *
 * A "message" goes straight to the recipient when it has an open
 * session, otherwise into the offline MessageQueue. Queued messages are
 * drained and pushed as soon as their recipient authenticates.
 */

#include "relay/relay_manager.h"

#include <type_traits>
#include <utility>

#include <spdlog/spdlog.h>

#include "relay/address.h"
#include "store/message_queue.h"

const std::array<RelayManager::StateHandler, 2> RelayManager::kDispatch = {
    &RelayManager::handle_unauthenticated,
    &RelayManager::handle_authenticated,
};

RelayManager::RelayManager(MessageQueue& queue, Clock clock)
    : queue_(queue), clock_(std::move(clock)) {}

void RelayManager::on_open(const std::shared_ptr<Session>& session, ConnectionContext& ctx) {
    ctx.state = ConnectionState::Unauthenticated;
    ctx.address.clear();
    spdlog::info("New connection from {}", session->peer());
}

void RelayManager::on_frame(const std::shared_ptr<Session>& session,
                            ConnectionContext& ctx,
                            const std::string& raw) {
    if (ctx.state == ConnectionState::Closed) return;

    InboundFrame frame;
    try {
        frame = parse_frame(raw);
    } catch (const FrameError& e) {
        spdlog::warn("Malformed frame from {}: {}", session->peer(), e.what());
        if (ctx.state == ConnectionState::Unauthenticated) {
            reject_unauthenticated(*session, ctx);
            return;
        }
        auto it = connections_.find(ctx.address);
        if (it != connections_.end() && it->second.session == session) {
            it->second.last_activity_ms = clock_();
        }
        session->send(frames::error("Failed to process message"));
        return;
    }

    spdlog::debug("Frame '{}' from {}", frame_type(frame), session->peer());
    const auto handler = kDispatch[static_cast<std::size_t>(ctx.state)];
    (this->*handler)(session, ctx, frame);
}

void RelayManager::on_close(const std::shared_ptr<Session>& session, ConnectionContext& ctx) {
    const ConnectionState previous = ctx.state;
    ctx.state = ConnectionState::Closed;
    if (previous != ConnectionState::Authenticated) return;

    // The entry may already belong to a newer session for the same address.
    auto it = connections_.find(ctx.address);
    if (it != connections_.end() && it->second.session == session) {
        connections_.erase(it);
        broadcast_status(ctx.address, "offline");
    }
    spdlog::info("User disconnected: {}", ctx.address);
}

void RelayManager::handle_unauthenticated(const std::shared_ptr<Session>& session,
                                          ConnectionContext& ctx,
                                          const InboundFrame& frame) {
    const auto* auth = std::get_if<AuthFrame>(&frame);
    if (auth == nullptr || !address::is_valid(auth->address)) {
        reject_unauthenticated(*session, ctx);
        return;
    }

    const std::string addr = address::normalize(auth->address);
    const int64_t now = clock_();

    auto& conn = connections_[addr];
    if (conn.session && conn.session != session) {
        spdlog::warn("Address {} authenticated again from {}; previous connection displaced",
                     addr, session->peer());
    }
    conn.session = session;
    conn.last_activity_ms = now;

    ctx.state = ConnectionState::Authenticated;
    ctx.address = addr;

    spdlog::info("User authenticated: {}", addr);
    session->send(frames::auth_success(addr, now));
    broadcast_status(addr, "online");

    deliver_queued(*session, addr);
}

void RelayManager::handle_authenticated(const std::shared_ptr<Session>& session,
                                        ConnectionContext& ctx,
                                        const InboundFrame& frame) {
    const int64_t now = clock_();
    auto it = connections_.find(ctx.address);
    if (it != connections_.end() && it->second.session == session) {
        it->second.last_activity_ms = now;
    }

    std::visit([&](const auto& f) {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, ChatFrame>) {
            handle_message(*session, ctx.address, f);
        } else if constexpr (std::is_same_v<T, TypingFrame>) {
            handle_typing(ctx.address, f);
        } else if constexpr (std::is_same_v<T, ReadReceiptFrame>) {
            handle_read_receipt(ctx.address, f);
        } else if constexpr (std::is_same_v<T, PingFrame>) {
            session->send(frames::pong(now));
        } else if constexpr (std::is_same_v<T, AuthFrame>) {
            spdlog::warn("Ignoring repeated auth from {}", ctx.address);
        } else {
            spdlog::warn("Unknown message type '{}' from {}", f.type, ctx.address);
        }
    }, frame);
}

void RelayManager::reject_unauthenticated(Session& session, ConnectionContext& ctx) {
    spdlog::warn("Rejecting unauthenticated connection from {}", session.peer());
    session.send(frames::error("Authentication required"));
    ctx.state = ConnectionState::Closed;
    session.close();
}

void RelayManager::handle_message(Session& sender, const std::string& from, const ChatFrame& frame) {
    const bool has_content = !frame.content.is_null() &&
                             !(frame.content.is_string() && frame.content.get_ref<const std::string&>().empty());
    if (frame.to.empty() || !has_content || frame.message_id.empty() ||
        !address::is_valid(frame.to)) {
        sender.send(frames::error("Invalid message format", frame.message_id));
        return;
    }

    const std::string to = address::normalize(frame.to);
    const int64_t now = clock_();
    const int64_t timestamp = frame.timestamp.value_or(now);

    // Presence is re-read here, right before use.
    if (Session* recipient = open_session(to)) {
        recipient->send(frames::message(from, frame.content, frame.message_id, timestamp));
        sender.send(frames::delivered(frame.message_id, to, now));
        spdlog::debug("Message {} delivered {} -> {}", frame.message_id, from, to);
        return;
    }

    QueuedMessage msg;
    msg.from = from;
    msg.content = frame.content;
    msg.message_id = frame.message_id;
    msg.timestamp = timestamp;
    queue_.enqueue(to, std::move(msg));

    sender.send(frames::queued(frame.message_id, to, now));
    spdlog::debug("Message {} queued {} -> {}", frame.message_id, from, to);
}

void RelayManager::handle_typing(const std::string& from, const TypingFrame& frame) {
    if (frame.to.empty()) return;
    if (Session* recipient = open_session(address::normalize(frame.to))) {
        recipient->send(frames::typing(from, frame.is_typing));
    }
}

void RelayManager::handle_read_receipt(const std::string& from, const ReadReceiptFrame& frame) {
    if (frame.to.empty() || frame.message_id.empty()) return;
    if (Session* recipient = open_session(address::normalize(frame.to))) {
        recipient->send(frames::read(from, frame.message_id, clock_()));
    }
}

void RelayManager::deliver_queued(Session& session, const std::string& addr) {
    // Removal is committed before the pushes; a failed write loses them.
    const auto pending = queue_.dequeue(addr);
    if (pending.empty()) return;

    spdlog::info("Delivering {} queued messages to {}", pending.size(), addr);
    for (const auto& msg : pending) {
        session.send(frames::message(msg.from, msg.content, msg.message_id, msg.timestamp, true));
    }
}

Session* RelayManager::open_session(const std::string& addr) const {
    auto it = connections_.find(addr);
    if (it == connections_.end() || !it->second.session->is_open()) return nullptr;
    return it->second.session.get();
}

std::size_t RelayManager::sweep_stale(int64_t now_ms, int64_t timeout_ms) {
    std::vector<std::pair<std::string, std::shared_ptr<Session>>> stale;
    for (const auto& entry : connections_) {
        if (now_ms - entry.second.last_activity_ms > timeout_ms) {
            stale.emplace_back(entry.first, entry.second.session);
        }
    }

    for (auto& victim : stale) {
        spdlog::warn("Closing stale connection for {}", victim.first);
        connections_.erase(victim.first);
        broadcast_status(victim.first, "offline");
        victim.second->abort();
    }
    return stale.size();
}

void RelayManager::close_all() {
    spdlog::info("Closing all connections ({})", connections_.size());
    auto connections = std::move(connections_);
    connections_.clear();
    for (auto& entry : connections) {
        entry.second.session->abort();
    }
}

bool RelayManager::is_online(const std::string& addr) const {
    return open_session(address::normalize(addr)) != nullptr;
}

std::vector<std::string> RelayManager::online_addresses() const {
    std::vector<std::string> out;
    out.reserve(connections_.size());
    for (const auto& entry : connections_) {
        out.push_back(entry.first);
    }
    return out;
}

int64_t RelayManager::last_activity(const std::string& addr) const {
    auto it = connections_.find(address::normalize(addr));
    return it == connections_.end() ? -1 : it->second.last_activity_ms;
}

void RelayManager::broadcast_status(const std::string& addr, const char* status) const {
    spdlog::debug("Status update: {} is {}", addr, status);
}
