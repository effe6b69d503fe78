#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

/*
 * Socket protocol frames. Each frame on the wire is one JSON object with
 * a "type" field. Inbound frames are decoded into a tagged variant;
 * outbound frames are built as JSON by the helpers in `frames`.
 *
 * Decoding is lenient about fields: a missing or mistyped field decodes
 * as empty so the relay can answer with a protocol error that still
 * names the messageId.
 */

struct AuthFrame {
    std::string address;
};

struct ChatFrame {
    std::string            to;
    nlohmann::json         content;
    std::string            message_id;
    std::optional<int64_t> timestamp;
};

struct TypingFrame {
    std::string    to;
    nlohmann::json is_typing;
};

struct ReadReceiptFrame {
    std::string to;
    std::string message_id;
};

struct PingFrame {};

struct UnknownFrame {
    std::string type;
};

using InboundFrame = std::variant<AuthFrame,
                                  ChatFrame,
                                  TypingFrame,
                                  ReadReceiptFrame,
                                  PingFrame,
                                  UnknownFrame>;

/// Raised when a frame is not a JSON object.
class FrameError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Decode one frame. Throws FrameError on malformed input.
InboundFrame parse_frame(const std::string& text);

/// The "type" string a decoded frame came from.
std::string frame_type(const InboundFrame& frame);

namespace frames {

nlohmann::json auth_success(const std::string& address, int64_t timestamp);

nlohmann::json message(const std::string& from,
                       const nlohmann::json& content,
                       const std::string& message_id,
                       int64_t timestamp,
                       bool queued = false);

nlohmann::json delivered(const std::string& message_id, const std::string& to, int64_t timestamp);
nlohmann::json queued(const std::string& message_id, const std::string& to, int64_t timestamp);
nlohmann::json typing(const std::string& from, const nlohmann::json& is_typing);
nlohmann::json read(const std::string& from, const std::string& message_id, int64_t timestamp);
nlohmann::json pong(int64_t timestamp);

/// `message_id` is echoed only when non-empty.
nlohmann::json error(const std::string& text, const std::string& message_id = {});

} // namespace frames
