#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "file_lock.hpp"
#include "kv_store.hpp"

namespace cosign {

// Store kept as a single JSON object on disk, shared between processes.
//
// Every operation takes a flock on "<path>.lock" and re-reads the document
// under it: reads share the lock, put and del hold it exclusively while they
// rewrite the document to "<path>.tmp" and rename that over the original.
// A crash leaves either the old or the new document, never a truncated one,
// and no process writes back a stale copy of another's records.
class JsonFileStore : public KeyValueStore {
public:
    // Holds the exclusive lock across several operations, so a
    // read-modify-write sequence by this store is atomic with respect to
    // other processes. Operations of the same store reuse the held lock.
    class Session {
    public:
        explicit Session(JsonFileStore& store);
        ~Session();

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

    private:
        JsonFileStore& store_;
    };

    explicit JsonFileStore(std::string path);

    std::optional<nlohmann::json> get(const std::string& key) const override;
    void put(const std::string& key, const nlohmann::json& value) override;
    void del(const std::string& key) override;
    std::vector<StoreEntry> keys_with_prefix(std::string_view prefix) const override;

    const std::string& path() const { return path_; }
    std::string lock_path() const { return path_ + ".lock"; }

private:
    // Caller holds mutex_
    std::optional<FileLock> lock_file(FileLock::Mode mode) const;
    void load() const;
    void save() const;

    std::string path_;
    mutable std::mutex mutex_;
    mutable nlohmann::json document_;
    std::unique_ptr<FileLock> session_lock_;
};

} // namespace cosign
