#pragma once

#include <map>
#include <mutex>
#include "kv_store.hpp"

namespace cosign {

// Process-local store, used by tests and as a scratch backend
class MemoryStore : public KeyValueStore {
public:
    std::optional<nlohmann::json> get(const std::string& key) const override;
    void put(const std::string& key, const nlohmann::json& value) override;
    void del(const std::string& key) override;
    std::vector<StoreEntry> keys_with_prefix(std::string_view prefix) const override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, nlohmann::json, std::less<>> entries_;
};

} // namespace cosign
