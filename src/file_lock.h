#pragma once
#include <string>

namespace tollgate {

// Cross-process advisory lock: flock(2) on <dir>/<name>.lock.
// Each acquire opens its own descriptor, so threads of one process exclude each other too.
class FileLock {
public:
    class Guard {
    public:
        Guard() = default;
        Guard(Guard&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
        Guard& operator=(Guard&& o) noexcept;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard() { release(); }

        bool held() const { return fd_ >= 0; }
        void release();

    private:
        friend class FileLock;
        explicit Guard(int fd) : fd_(fd) {}
        int fd_{-1};
    };

    explicit FileLock(std::string dir) : dir_(std::move(dir)) {}

    // Polls every 50 ms. Throws EngineError(LOCK_TIMEOUT) after timeout_ms,
    // EngineError(STORAGE_ERROR) if the lock file cannot be opened.
    Guard acquire(const std::string& name, int timeout_ms = 5000) const;

    // Non-blocking check: true while another descriptor holds the lock
    bool is_locked(const std::string& name) const;

    // Unlinks the lock file. Call while still holding the guard for `name`.
    void discard(const std::string& name) const;

private:
    std::string dir_;
};

}
