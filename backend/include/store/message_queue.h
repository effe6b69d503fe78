#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "relay/clock.h"

/// A message held for a recipient that was offline at send time.
struct QueuedMessage {
    uint64_t       id = 0;         ///< assigned by the queue on enqueue
    std::string    from;
    std::string    to;
    nlohmann::json content;        ///< opaque payload, never inspected
    std::string    message_id;     ///< client-chosen id
    int64_t        timestamp = 0;  ///< client timestamp, or server time at routing
    int64_t        queued_at = 0;
};

void to_json(nlohmann::json& j, const QueuedMessage& msg);

/// Aggregate counters reported by GET /api/messages/stats/all.
struct QueueStats {
    std::size_t total_users    = 0;
    std::size_t total_messages = 0;
    std::size_t max_messages_per_user = 0;
    int64_t     retention_hours = 0;
};

void to_json(nlohmann::json& j, const QueueStats& stats);

/**
 * Per-address bounded FIFO of undelivered messages.
 *
 * When a sequence is full the oldest entry is dropped before the new one
 * is appended. Entries older than the retention window are removed by
 * cleanup(); sequences left empty are dropped.
 */
class MessageQueue {
public:
    /// Ten years; keeps retention_ms() well inside int64.
    static constexpr int64_t kMaxRetentionHours = 24 * 365 * 10;

    MessageQueue(std::size_t max_messages_per_user,
                 int64_t retention_hours,
                 Clock clock = system_now_ms);

    /// Append `msg` to the sequence for `addr`. Sets `id` and `queued_at`.
    void enqueue(const std::string& addr, QueuedMessage msg);

    /// Return every entry for `addr` in insertion order and remove them.
    std::vector<QueuedMessage> dequeue(const std::string& addr);

    /// Up to `limit` oldest entries, without removing them.
    [[nodiscard]] std::vector<QueuedMessage> peek(const std::string& addr, std::size_t limit) const;

    /// Remove the sequence for `addr`. False if there was nothing queued.
    bool clear(const std::string& addr);

    [[nodiscard]] std::size_t queue_size(const std::string& addr) const;
    [[nodiscard]] std::size_t total_size() const;
    [[nodiscard]] QueueStats stats() const;

    /// Purge entries with age >= retention at time `now_ms`. Returns the
    /// number of entries removed.
    std::size_t cleanup(int64_t now_ms);

    [[nodiscard]] std::size_t max_messages_per_user() const { return max_per_user_; }
    [[nodiscard]] int64_t retention_ms() const { return retention_hours_ * 3600 * 1000; }

private:
    std::size_t max_per_user_;
    int64_t     retention_hours_;
    Clock       clock_;
    uint64_t    next_id_ = 1;
    std::unordered_map<std::string, std::deque<QueuedMessage>> queues_;
};
