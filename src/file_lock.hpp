// Advisory inter-process lock on a lock file
//
// - flock(2) on a dedicated file, so the data file itself can be replaced by rename
// - Released when the object is destroyed or moved from
// - Locks taken through different open() calls exclude each other, even
//   inside one process

#pragma once

#include <cerrno>
#include <cstring>
#include <string>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include "error.hpp"

namespace cosign {

class FileLock {
public:
    enum class Mode {
        Shared,
        Exclusive
    };

    // Blocks until the lock is granted; throws StorageError if the lock file
    // cannot be opened or locked
    FileLock(const std::string& path, Mode mode) {
        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd_ < 0) {
            throw CosignError(CosignError::ErrorType::Storage,
                "Failed to open lock file " + path + ": " + std::strerror(errno));
        }
        const int operation = mode == Mode::Exclusive ? LOCK_EX : LOCK_SH;
        while (::flock(fd_, operation) != 0) {
            if (errno == EINTR) {
                continue;
            }
            const int error = errno;
            ::close(fd_);
            fd_ = -1;
            throw CosignError(CosignError::ErrorType::Storage,
                "Failed to lock " + path + ": " + std::strerror(error));
        }
    }

    ~FileLock() { release(); }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    FileLock(FileLock&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

    FileLock& operator=(FileLock&& other) noexcept {
        if (this != &other) {
            release();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

private:
    void release() noexcept {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
            fd_ = -1;
        }
    }

    int fd_ = -1;
};

} // namespace cosign
