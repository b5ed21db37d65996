// Locked, self-wiping buffer for private key material
//
// - The pages are mlock'ed so the key is never swapped to disk
// - The bytes are zeroed before the buffer is released
// - Copies are not allowed; ownership moves

#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <sys/mman.h>

namespace cosign {

class SecureMemory {
public:
    explicit SecureMemory(std::span<const uint8_t> input)
        : data_(new uint8_t[input.size()])
        , size_(input.size())
    {
        std::memcpy(data_, input.data(), size_);
        // Without CAP_IPC_LOCK or enough RLIMIT_MEMLOCK this fails; the
        // buffer is still wiped on release
        locked_ = mlock(data_, size_) == 0;
    }

    ~SecureMemory() { release(); }

    SecureMemory(const SecureMemory&) = delete;
    SecureMemory& operator=(const SecureMemory&) = delete;

    SecureMemory(SecureMemory&& other) noexcept
        : data_(other.data_)
        , size_(other.size_)
        , locked_(other.locked_)
    {
        other.data_ = nullptr;
        other.size_ = 0;
        other.locked_ = false;
    }

    SecureMemory& operator=(SecureMemory&& other) noexcept {
        if (this != &other) {
            release();
            data_ = other.data_;
            size_ = other.size_;
            locked_ = other.locked_;
            other.data_ = nullptr;
            other.size_ = 0;
            other.locked_ = false;
        }
        return *this;
    }

    std::span<const uint8_t> bytes() const { return {data_, size_}; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0 || data_ == nullptr; }
    bool locked() const { return locked_; }

private:
    void release() {
        if (!data_) {
            return;
        }
        // volatile so the wipe is not optimized away
        volatile uint8_t* p = data_;
        for (size_t i = 0; i < size_; ++i) {
            p[i] = 0;
        }
        if (locked_) {
            munlock(data_, size_);
        }
        delete[] data_;
        data_ = nullptr;
        size_ = 0;
        locked_ = false;
    }

    uint8_t* data_;
    size_t size_;
    bool locked_ = false;
};

} // namespace cosign
