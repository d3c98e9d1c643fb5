#include "blob_store.h"
#include "paths.h"
#include "log.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace tollgate {

std::vector<std::string> BlobStore::lines(const std::string& name) const {
    std::vector<std::string> out;
    std::string data;
    if (!get(name, data)) return out;
    std::istringstream in(data);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) out.push_back(line);
    }
    return out;
}

FileBlobStore::FileBlobStore(std::string root) : root_(std::move(root)) {}

bool FileBlobStore::open(std::string& err) {
    if (!ensure_dir(root_)) {
        err = "cannot create data directory " + root_;
        return false;
    }
    return true;
}

std::string FileBlobStore::path_of(const std::string& name) const {
    return join_path(root_, name);
}

bool FileBlobStore::get(const std::string& name, std::string& out) const {
    std::ifstream f(path_of(name), std::ios::binary);
    if (!f.is_open()) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) return false;
    out = ss.str();
    return true;
}

static bool write_fd_all(int fd, const char* p, size_t n) {
    while (n) {
        ssize_t w = ::write(fd, p, n);
        if (w < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += w;
        n -= (size_t)w;
    }
    return true;
}

bool FileBlobStore::put(const std::string& name, const std::string& data, std::string& err) {
    const std::string path = path_of(name);
    const std::string tmp = path + ".tmp";

    int fd = ::open(tmp.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0600);
    if (fd < 0) {
        err = "open " + tmp + ": " + std::strerror(errno);
        return false;
    }
    bool ok = write_fd_all(fd, data.data(), data.size());
    if (ok) ok = (::fsync(fd) == 0);
    ::close(fd);

    if (!ok) {
        std::remove(tmp.c_str());
        err = "write to temporary file failed";
        return false;
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        std::remove(tmp.c_str());
        err = "atomic rename failed for " + path;
        return false;
    }
    TOLLGATE_LOG_TRACE(LogCategory::STORAGE, "wrote " + path);
    return true;
}

bool FileBlobStore::append_line(const std::string& name, const std::string& line, std::string& err) {
    const std::string path = path_of(name);
    int fd = ::open(path.c_str(), O_CREAT | O_APPEND | O_WRONLY | O_CLOEXEC, 0600);
    if (fd < 0) {
        err = "open " + path + ": " + std::strerror(errno);
        return false;
    }
    std::string rec = line;
    rec.push_back('\n');
    // O_APPEND keeps each single write() contiguous
    bool ok = write_fd_all(fd, rec.data(), rec.size());
    ::close(fd);
    if (!ok) {
        err = "append to " + path + " failed";
        return false;
    }
    return true;
}

bool FileBlobStore::del(const std::string& name, std::string& err) {
    const std::string path = path_of(name);
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        err = "unlink " + path + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

bool FileBlobStore::exists(const std::string& name) const {
    struct stat st;
    return ::stat(path_of(name).c_str(), &st) == 0;
}

}
