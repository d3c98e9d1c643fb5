#include "file_lock.h"
#include "errors.h"
#include "log.h"
#include "paths.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace tollgate {

static constexpr int LOCK_RETRY_MS = 50;

FileLock::Guard& FileLock::Guard::operator=(Guard&& o) noexcept {
    if (this != &o) {
        release();
        fd_ = o.fd_;
        o.fd_ = -1;
    }
    return *this;
}

void FileLock::Guard::release() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        close(fd_);
        fd_ = -1;
    }
}

FileLock::Guard FileLock::acquire(const std::string& name, int timeout_ms) const {
    const std::string lock_path = join_path(dir_, name + ".lock");
    int fd = open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw EngineError(ErrorCode::STORAGE_ERROR,
                          "failed to create lock file " + lock_path + ": " + std::strerror(errno));
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;) {
        if (flock(fd, LOCK_EX | LOCK_NB) == 0) {
            TOLLGATE_LOG_TRACE(LogCategory::STORAGE, "lock acquired: " + name);
            return Guard(fd);
        }
        if (errno != EWOULDBLOCK && errno != EINTR) {
            const std::string why = std::strerror(errno);
            close(fd);
            throw EngineError(ErrorCode::STORAGE_ERROR, "flock " + lock_path + ": " + why);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            close(fd);
            throw EngineError(ErrorCode::LOCK_TIMEOUT,
                              "could not acquire lock '" + name + "' within " + std::to_string(timeout_ms) + " ms");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(LOCK_RETRY_MS));
    }
}

bool FileLock::is_locked(const std::string& name) const {
    const std::string lock_path = join_path(dir_, name + ".lock");
    int fd = open(lock_path.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) return false;
    bool locked = (flock(fd, LOCK_EX | LOCK_NB) < 0);
    if (!locked) flock(fd, LOCK_UN);
    close(fd);
    return locked;
}

void FileLock::discard(const std::string& name) const {
    const std::string lock_path = join_path(dir_, name + ".lock");
    if (unlink(lock_path.c_str()) != 0 && errno != ENOENT) {
        log_warn(LogCategory::STORAGE, "could not remove lock file " + lock_path + ": " + std::strerror(errno));
    }
}

}
