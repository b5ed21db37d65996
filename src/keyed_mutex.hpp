#pragma once

#include <condition_variable>
#include <mutex>
#include <set>
#include <string>

namespace cosign {

// Mutual exclusion per string key. Holders of different keys never block
// each other; entries exist only while a key is held.
class KeyedMutex {
public:
    class Guard {
    public:
        Guard(KeyedMutex& owner, std::string key)
            : owner_(owner)
            , key_(std::move(key))
        {
            owner_.lock(key_);
        }

        ~Guard() { owner_.unlock(key_); }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        KeyedMutex& owner_;
        std::string key_;
    };

    Guard acquire(const std::string& key) { return Guard(*this, key); }

private:
    void lock(const std::string& key) {
        std::unique_lock<std::mutex> lock(mutex_);
        released_.wait(lock, [&] { return held_.count(key) == 0; });
        held_.insert(key);
    }

    void unlock(const std::string& key) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_.erase(key);
        }
        released_.notify_all();
    }

    std::mutex mutex_;
    std::condition_variable released_;
    std::set<std::string> held_;
};

} // namespace cosign
