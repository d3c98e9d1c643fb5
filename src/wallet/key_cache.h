#pragma once
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tollgate {

// Decrypted signing key. Bytes are wiped on destruction.
struct ResolvedKey {
    std::vector<uint8_t> priv;  // 32 bytes
    std::string address;        // EIP-55

    ResolvedKey() = default;
    ResolvedKey(const ResolvedKey&) = delete;
    ResolvedKey& operator=(const ResolvedKey&) = delete;
    ~ResolvedKey();
};

// Process-lifetime memo of the resolved key with single-flight resolution:
// concurrent callers share one resolver run and see the same key or the same
// exception. Failures are not cached.
class KeyCache {
public:
    using Resolver = std::function<std::shared_ptr<ResolvedKey>()>;

    KeyCache() = default;
    ~KeyCache();
    KeyCache(const KeyCache&) = delete;
    KeyCache& operator=(const KeyCache&) = delete;

    std::shared_ptr<const ResolvedKey> get_or_resolve(const Resolver& resolver);
    bool has() const;
    // Wipes the cached bytes in place and drops the cache. A resolution still
    // in flight completes for its waiters but is not cached.
    void clear();

    // Wipes the most recently cached key at normal exit and on SIGINT/SIGTERM
    // (then re-raises with the default action). Idempotent.
    static void install_exit_wipe();

private:
    using Ptr = std::shared_ptr<ResolvedKey>;

    mutable std::mutex mu_;
    Ptr key_;
    std::shared_future<Ptr> inflight_;
    uint64_t generation_{0};
};

// Passwords entered this session, keyed by lowercased address. A password is
// remembered as soon as it is entered, whether or not it later decrypts.
class SessionPasswordCache {
public:
    using Prompt = std::function<std::string(const std::string& address)>;

    ~SessionPasswordCache();

    std::string get_or_prompt(const std::string& address, const Prompt& prompt);
    bool has(const std::string& address) const;
    size_t size() const;
    bool remove(const std::string& address);
    // Overwrites every password before dropping it.
    void clear();

private:
    mutable std::mutex mu_;
    std::map<std::string, std::string> cache_;
};

}
