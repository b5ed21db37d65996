#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace cosign {

struct StoreEntry {
    std::string key;
    nlohmann::json value;
};

// Opaque key/value persistence for wallet and transaction records.
// Keys are "wallet:<walletId>" and "tx:<transactionId>".
// Implementations throw StorageError on I/O failure.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<nlohmann::json> get(const std::string& key) const = 0;
    virtual void put(const std::string& key, const nlohmann::json& value) = 0;

    // Removing an absent key is not an error
    virtual void del(const std::string& key) = 0;

    // All entries whose key starts with `prefix`, in key order
    virtual std::vector<StoreEntry> keys_with_prefix(std::string_view prefix) const = 0;
};

} // namespace cosign
