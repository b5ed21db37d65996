#include "json_file_store.hpp"
#include "error.hpp"
#include "log.hpp"
#include <filesystem>
#include <fstream>

namespace cosign {

using json = nlohmann::json;

JsonFileStore::Session::Session(JsonFileStore& store)
    : store_(store)
{
    std::lock_guard<std::mutex> lock(store_.mutex_);
    if (store_.session_lock_) {
        throw CosignError(CosignError::ErrorType::State, "Store " + store_.path_ + " already holds a session");
    }
    store_.session_lock_ = std::make_unique<FileLock>(store_.lock_path(), FileLock::Mode::Exclusive);
}

JsonFileStore::Session::~Session() {
    std::lock_guard<std::mutex> lock(store_.mutex_);
    store_.session_lock_.reset();
}

JsonFileStore::JsonFileStore(std::string path)
    : path_(std::move(path))
    , document_(json::object())
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto file_lock = lock_file(FileLock::Mode::Shared);
    load();
    LOG_DEBUG("Opened store " << path_ << " with " << document_.size() << " records");
}

std::optional<FileLock> JsonFileStore::lock_file(FileLock::Mode mode) const {
    if (session_lock_) {
        return std::nullopt;
    }
    return std::optional<FileLock>(std::in_place, lock_path(), mode);
}

// Replaces the cached document with the file contents; caller holds the file lock
void JsonFileStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        document_ = json::object();
        return;
    }

    std::ifstream file(path_);
    if (!file) {
        throw CosignError(CosignError::ErrorType::Storage, "Failed to open store " + path_ + " for reading");
    }

    json parsed;
    try {
        file >> parsed;
    } catch (const json::exception& e) {
        throw CosignError(CosignError::ErrorType::Storage,
            "Store " + path_ + " is not valid JSON: " + e.what());
    }
    if (!parsed.is_object()) {
        throw CosignError(CosignError::ErrorType::Storage, "Store " + path_ + " must hold a JSON object");
    }
    document_ = std::move(parsed);
}

void JsonFileStore::save() const {
    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file) {
            throw CosignError(CosignError::ErrorType::Storage, "Failed to open " + tmp_path + " for writing");
        }
        file << document_.dump(4);
        file.flush();
        if (!file) {
            throw CosignError(CosignError::ErrorType::Storage, "Failed to write " + tmp_path);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        throw CosignError(CosignError::ErrorType::Storage,
            "Failed to replace " + path_ + ": " + ec.message());
    }
}

std::optional<json> JsonFileStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto file_lock = lock_file(FileLock::Mode::Shared);
    load();
    auto it = document_.find(key);
    if (it == document_.end()) {
        return std::nullopt;
    }
    return *it;
}

void JsonFileStore::put(const std::string& key, const json& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto file_lock = lock_file(FileLock::Mode::Exclusive);
    load();
    json previous = document_.contains(key) ? document_[key] : json();
    document_[key] = value;
    try {
        save();
    } catch (const CosignError&) {
        // Keep memory consistent with disk
        if (previous.is_null()) {
            document_.erase(key);
        } else {
            document_[key] = std::move(previous);
        }
        throw;
    }
}

void JsonFileStore::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto file_lock = lock_file(FileLock::Mode::Exclusive);
    load();
    auto it = document_.find(key);
    if (it == document_.end()) {
        return;
    }
    json previous = *it;
    document_.erase(it);
    try {
        save();
    } catch (const CosignError&) {
        document_[key] = std::move(previous);
        throw;
    }
}

std::vector<StoreEntry> JsonFileStore::keys_with_prefix(std::string_view prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto file_lock = lock_file(FileLock::Mode::Shared);
    load();
    std::vector<StoreEntry> result;
    // nlohmann::json objects iterate in key order
    for (auto it = document_.begin(); it != document_.end(); ++it) {
        if (it.key().starts_with(prefix)) {
            result.push_back({it.key(), it.value()});
        }
    }
    return result;
}

} // namespace cosign
