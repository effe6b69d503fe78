/**
 * Frame codec for the relay socket protocol.
 */

#include "relay/frame.h"

#include <limits>

using json = nlohmann::json;

namespace {

std::string string_field(const json& obj, const char* name) {
    auto it = obj.find(name);
    if (it == obj.end()) return {};
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number()) return it->dump();
    return {};
}

// Only integral values that fit int64 count; anything else falls back to
// server time.
std::optional<int64_t> timestamp_field(const json& obj) {
    auto it = obj.find("timestamp");
    if (it == obj.end() || !it->is_number_integer()) return std::nullopt;
    if (it->is_number_unsigned() &&
        it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return std::nullopt;
    }
    return it->get<int64_t>();
}

json value_field(const json& obj, const char* name) {
    auto it = obj.find(name);
    return it == obj.end() ? json() : *it;
}

struct TypeName {
    std::string operator()(const AuthFrame&) const        { return "auth"; }
    std::string operator()(const ChatFrame&) const        { return "message"; }
    std::string operator()(const TypingFrame&) const      { return "typing"; }
    std::string operator()(const ReadReceiptFrame&) const { return "read_receipt"; }
    std::string operator()(const PingFrame&) const        { return "ping"; }
    std::string operator()(const UnknownFrame& f) const   { return f.type; }
};

} // namespace

InboundFrame parse_frame(const std::string& text) {
    json obj;
    try {
        obj = json::parse(text);
    } catch (const json::parse_error& e) {
        throw FrameError(e.what());
    }
    if (!obj.is_object()) {
        throw FrameError("frame is not a JSON object");
    }

    const std::string type = string_field(obj, "type");

    if (type == "auth") {
        return AuthFrame{string_field(obj, "address")};
    }
    if (type == "message") {
        return ChatFrame{string_field(obj, "to"),
                         value_field(obj, "content"),
                         string_field(obj, "messageId"),
                         timestamp_field(obj)};
    }
    if (type == "typing") {
        return TypingFrame{string_field(obj, "to"), value_field(obj, "isTyping")};
    }
    if (type == "read_receipt") {
        return ReadReceiptFrame{string_field(obj, "to"), string_field(obj, "messageId")};
    }
    if (type == "ping") {
        return PingFrame{};
    }
    return UnknownFrame{type};
}

std::string frame_type(const InboundFrame& frame) {
    return std::visit(TypeName{}, frame);
}

namespace frames {

json auth_success(const std::string& address, int64_t timestamp) {
    return {{"type", "auth_success"}, {"address", address}, {"timestamp", timestamp}};
}

json message(const std::string& from,
             const json& content,
             const std::string& message_id,
             int64_t timestamp,
             bool queued) {
    json j = {
        {"type", "message"},
        {"from", from},
        {"content", content},
        {"messageId", message_id},
        {"timestamp", timestamp},
    };
    if (queued) j["queued"] = true;
    return j;
}

json delivered(const std::string& message_id, const std::string& to, int64_t timestamp) {
    return {{"type", "delivered"}, {"messageId", message_id}, {"to", to}, {"timestamp", timestamp}};
}

json queued(const std::string& message_id, const std::string& to, int64_t timestamp) {
    return {{"type", "queued"}, {"messageId", message_id}, {"to", to}, {"timestamp", timestamp}};
}

json typing(const std::string& from, const json& is_typing) {
    return {{"type", "typing"}, {"from", from}, {"isTyping", is_typing}};
}

json read(const std::string& from, const std::string& message_id, int64_t timestamp) {
    return {{"type", "read"}, {"from", from}, {"messageId", message_id}, {"timestamp", timestamp}};
}

json pong(int64_t timestamp) {
    return {{"type", "pong"}, {"timestamp", timestamp}};
}

json error(const std::string& text, const std::string& message_id) {
    json j = {{"type", "error"}, {"message", text}};
    if (!message_id.empty()) j["messageId"] = message_id;
    return j;
}

} // namespace frames
