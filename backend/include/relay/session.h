#pragma once

#include <string>

#include <nlohmann/json.hpp>

/**
 * A live client socket as seen by the relay.
 *
 * Implemented over asio by PeerSession; tests use an in-memory fake.
 * All calls happen on the io thread.
 */
class Session {
public:
    virtual ~Session() = default;

    /// Queue one frame for delivery. Silently discarded once closed.
    virtual void send(const nlohmann::json& frame) = 0;

    /// Close once every queued frame has been written. Idempotent.
    virtual void close() = 0;

    /// Close now, dropping any frames still queued. Idempotent.
    virtual void abort() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;

    /// Remote endpoint, for log lines.
    [[nodiscard]] virtual std::string peer() const = 0;
};
