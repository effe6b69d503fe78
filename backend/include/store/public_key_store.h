#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "relay/clock.h"

/// One published key. `created_at` survives updates, `updated_at` does not.
struct PublicKeyRecord {
    std::string address;
    std::string public_key;
    int64_t     created_at = 0;
    int64_t     updated_at = 0;
};

void to_json(nlohmann::json& j, const PublicKeyRecord& record);

/**
 * In-memory directory of public keys used for end-to-end key discovery.
 *
 * Keys are opaque text; the directory never inspects them. All lookups
 * normalize the address first.
 */
class PublicKeyStore {
public:
    explicit PublicKeyStore(Clock clock = system_now_ms);

    /// Insert or update the key for `addr`. Throws std::invalid_argument
    /// when `public_key` is empty.
    PublicKeyRecord store(const std::string& addr, const std::string& public_key);

    [[nodiscard]] std::optional<PublicKeyRecord> get(const std::string& addr) const;

    /// Found records only, keyed by normalized address.
    [[nodiscard]] std::map<std::string, PublicKeyRecord>
    get_multiple(const std::vector<std::string>& addrs) const;

    [[nodiscard]] bool exists(const std::string& addr) const;

    /// Returns false when no key was stored for `addr`.
    bool remove(const std::string& addr);

    [[nodiscard]] std::size_t count() const { return keys_.size(); }
    [[nodiscard]] std::vector<std::string> addresses() const;

private:
    Clock clock_;
    std::unordered_map<std::string, PublicKeyRecord> keys_;
};
