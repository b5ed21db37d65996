#include "memory_store.hpp"

namespace cosign {

std::optional<nlohmann::json> MemoryStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryStore::put(const std::string& key, const nlohmann::json& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = value;
}

void MemoryStore::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(key);
}

std::vector<StoreEntry> MemoryStore::keys_with_prefix(std::string_view prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StoreEntry> result;
    for (auto it = entries_.lower_bound(prefix); it != entries_.end() && it->first.starts_with(prefix); ++it) {
        result.push_back({it->first, it->second});
    }
    return result;
}

size_t MemoryStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace cosign
