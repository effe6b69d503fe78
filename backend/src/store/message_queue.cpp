/**
 * MessageQueue: offline store for messages whose recipient has no live
 * connection.
 *
 * Memory only. Capacity overflow evicts from the head so the newest
 * messages are always kept; the sender is never told.
 */

#include "store/message_queue.h"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "relay/address.h"

void to_json(nlohmann::json& j, const QueuedMessage& msg) {
    j = nlohmann::json{
        {"id",        msg.id},
        {"from",      msg.from},
        {"to",        msg.to},
        {"content",   msg.content},
        {"messageId", msg.message_id},
        {"timestamp", msg.timestamp},
        {"queuedAt",  msg.queued_at},
    };
}

void to_json(nlohmann::json& j, const QueueStats& stats) {
    j = nlohmann::json{
        {"totalUsers",         stats.total_users},
        {"totalMessages",      stats.total_messages},
        {"maxMessagesPerUser", stats.max_messages_per_user},
        {"retentionHours",     stats.retention_hours},
    };
}

MessageQueue::MessageQueue(std::size_t max_messages_per_user,
                           int64_t retention_hours,
                           Clock clock)
    : max_per_user_(max_messages_per_user),
      retention_hours_(retention_hours),
      clock_(std::move(clock)) {
    if (max_per_user_ == 0) {
        throw std::invalid_argument("max_messages_per_user must be positive");
    }
    if (retention_hours_ <= 0 || retention_hours_ > kMaxRetentionHours) {
        throw std::invalid_argument("retention_hours must be in 1.." + std::to_string(kMaxRetentionHours));
    }
}

void MessageQueue::enqueue(const std::string& addr, QueuedMessage msg) {
    const std::string key = address::normalize(addr);
    auto& queue = queues_[key];

    if (queue.size() >= max_per_user_) {
        spdlog::warn("Queue full for {} ({} messages), dropping oldest", key, queue.size());
        queue.pop_front();
    }

    msg.id = next_id_++;
    msg.to = key;
    msg.queued_at = clock_();
    queue.push_back(std::move(msg));

    spdlog::debug("Message {} enqueued for {} (size {})",
                  queue.back().message_id, key, queue.size());
}

std::vector<QueuedMessage> MessageQueue::dequeue(const std::string& addr) {
    const std::string key = address::normalize(addr);
    auto it = queues_.find(key);
    if (it == queues_.end()) return {};

    std::vector<QueuedMessage> out(std::make_move_iterator(it->second.begin()),
                                   std::make_move_iterator(it->second.end()));
    queues_.erase(it);

    spdlog::debug("Dequeued {} messages for {}", out.size(), key);
    return out;
}

std::vector<QueuedMessage> MessageQueue::peek(const std::string& addr, std::size_t limit) const {
    auto it = queues_.find(address::normalize(addr));
    if (it == queues_.end()) return {};

    const auto n = std::min(limit, it->second.size());
    return std::vector<QueuedMessage>(it->second.begin(),
                                      it->second.begin() + static_cast<std::ptrdiff_t>(n));
}

bool MessageQueue::clear(const std::string& addr) {
    const std::string key = address::normalize(addr);
    const bool removed = queues_.erase(key) > 0;
    if (removed) {
        spdlog::info("Queue cleared for {}", key);
    }
    return removed;
}

std::size_t MessageQueue::queue_size(const std::string& addr) const {
    auto it = queues_.find(address::normalize(addr));
    return it == queues_.end() ? 0 : it->second.size();
}

std::size_t MessageQueue::total_size() const {
    std::size_t total = 0;
    for (const auto& entry : queues_) {
        total += entry.second.size();
    }
    return total;
}

QueueStats MessageQueue::stats() const {
    QueueStats s;
    s.total_users = queues_.size();
    s.total_messages = total_size();
    s.max_messages_per_user = max_per_user_;
    s.retention_hours = retention_hours_;
    return s;
}

std::size_t MessageQueue::cleanup(int64_t now_ms) {
    const int64_t retention = retention_ms();
    std::size_t removed = 0;

    for (auto it = queues_.begin(); it != queues_.end();) {
        auto& queue = it->second;
        const auto before = queue.size();
        queue.erase(std::remove_if(queue.begin(), queue.end(),
                                   [&](const QueuedMessage& m) {
                                       return now_ms - m.queued_at >= retention;
                                   }),
                    queue.end());
        removed += before - queue.size();

        if (queue.empty()) {
            it = queues_.erase(it);
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        spdlog::info("Expired messages cleaned up: {}", removed);
    }
    return removed;
}
