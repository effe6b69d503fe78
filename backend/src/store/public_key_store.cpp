/**
 * PublicKeyStore: address → public key directory.
 *
 * Lives for the lifetime of the node and is only touched from the io
 * thread, so it carries no locking.
 */

#include "store/public_key_store.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "relay/address.h"

void to_json(nlohmann::json& j, const PublicKeyRecord& record) {
    j = nlohmann::json{
        {"address",   record.address},
        {"publicKey", record.public_key},
        {"createdAt", record.created_at},
        {"updatedAt", record.updated_at},
    };
}

PublicKeyStore::PublicKeyStore(Clock clock) : clock_(std::move(clock)) {}

PublicKeyRecord PublicKeyStore::store(const std::string& addr, const std::string& public_key) {
    if (public_key.empty()) {
        throw std::invalid_argument("Invalid public key format");
    }

    const std::string key = address::normalize(addr);
    const int64_t now = clock_();

    PublicKeyRecord record;
    record.address    = key;
    record.public_key = public_key;
    record.updated_at = now;

    auto it = keys_.find(key);
    record.created_at = (it != keys_.end()) ? it->second.created_at : now;

    keys_[key] = record;
    spdlog::debug("Public key stored for {} ({} bytes)", key, public_key.size());
    return record;
}

std::optional<PublicKeyRecord> PublicKeyStore::get(const std::string& addr) const {
    auto it = keys_.find(address::normalize(addr));
    if (it == keys_.end()) return std::nullopt;
    return it->second;
}

std::map<std::string, PublicKeyRecord>
PublicKeyStore::get_multiple(const std::vector<std::string>& addrs) const {
    std::map<std::string, PublicKeyRecord> found;
    for (const auto& addr : addrs) {
        const std::string key = address::normalize(addr);
        auto it = keys_.find(key);
        if (it != keys_.end()) {
            found.emplace(key, it->second);
        }
    }
    return found;
}

bool PublicKeyStore::exists(const std::string& addr) const {
    return keys_.count(address::normalize(addr)) > 0;
}

bool PublicKeyStore::remove(const std::string& addr) {
    const std::string key = address::normalize(addr);
    const bool removed = keys_.erase(key) > 0;
    if (removed) {
        spdlog::info("Public key deleted for {}", key);
    }
    return removed;
}

std::vector<std::string> PublicKeyStore::addresses() const {
    std::vector<std::string> out;
    out.reserve(keys_.size());
    for (const auto& entry : keys_) {
        out.push_back(entry.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}
