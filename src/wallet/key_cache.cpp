#include "wallet/key_cache.h"
#include "hex.h"
#include "crypto/secure_random.h"

#include <atomic>
#include <csignal>
#include <signal.h>
#include <cstdlib>

namespace tollgate {

// The exit hook must be reachable from a signal handler, so the one key it
// wipes is published through these atomics.
static std::atomic<uint8_t*> g_wipe_ptr{nullptr};
static std::atomic<size_t> g_wipe_len{0};

static void publish_for_wipe(std::vector<uint8_t>* bytes) {
    g_wipe_len.store(bytes ? bytes->size() : 0);
    g_wipe_ptr.store(bytes && !bytes->empty() ? bytes->data() : nullptr);
}

static void unpublish_if(const uint8_t* p) {
    uint8_t* expected = const_cast<uint8_t*>(p);
    g_wipe_ptr.compare_exchange_strong(expected, nullptr);
}

// Async-signal-safe: plain volatile stores only.
static void wipe_published() {
    uint8_t* p = g_wipe_ptr.exchange(nullptr);
    const size_t n = g_wipe_len.load();
    if (!p) return;
    volatile uint8_t* v = p;
    for (size_t i = 0; i < n; ++i) v[i] = 0;
}

extern "C" void tollgate_exit_wipe() {
    wipe_published();
}

extern "C" void tollgate_signal_wipe(int sig) {
    wipe_published();
    std::signal(sig, SIG_DFL);
    std::raise(sig);
}

ResolvedKey::~ResolvedKey() {
    if (!priv.empty()) unpublish_if(priv.data());
    secure_wipe(priv);
}

KeyCache::~KeyCache() {
    clear();
}

std::shared_ptr<const ResolvedKey> KeyCache::get_or_resolve(const Resolver& resolver) {
    std::shared_future<Ptr> waiter;
    std::promise<Ptr> promise;
    uint64_t gen = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (key_) return key_;
        if (inflight_.valid()) {
            waiter = inflight_;
        } else {
            inflight_ = promise.get_future().share();
            gen = generation_;
        }
    }
    if (waiter.valid()) return waiter.get();

    Ptr resolved;
    try {
        resolved = resolver();
    } catch (const std::exception&) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (generation_ == gen) inflight_ = std::shared_future<Ptr>();
        }
        promise.set_exception(std::current_exception());
        throw;
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        if (generation_ == gen) {
            key_ = resolved;
            inflight_ = std::shared_future<Ptr>();
            if (key_) publish_for_wipe(&key_->priv);
        }
    }
    promise.set_value(resolved);
    return resolved;
}

bool KeyCache::has() const {
    std::lock_guard<std::mutex> lk(mu_);
    return static_cast<bool>(key_);
}

void KeyCache::clear() {
    std::lock_guard<std::mutex> lk(mu_);
    if (key_) {
        unpublish_if(key_->priv.data());
        secure_wipe(key_->priv);
        key_.reset();
    }
    inflight_ = std::shared_future<Ptr>();
    ++generation_;
}

void KeyCache::install_exit_wipe() {
    static std::once_flag once;
    std::call_once(once, [] {
        std::atexit(tollgate_exit_wipe);
        struct sigaction sa{};
        sa.sa_handler = tollgate_signal_wipe;
        sigemptyset(&sa.sa_mask);
        sigaction(SIGINT, &sa, nullptr);
        sigaction(SIGTERM, &sa, nullptr);
    });
}

SessionPasswordCache::~SessionPasswordCache() {
    clear();
}

std::string SessionPasswordCache::get_or_prompt(const std::string& address, const Prompt& prompt) {
    const std::string key = to_lower(address);
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = cache_.find(key);
        if (it != cache_.end()) return it->second;
    }
    std::string pw = prompt(address);
    std::lock_guard<std::mutex> lk(mu_);
    auto ins = cache_.emplace(key, pw);
    return ins.first->second;
}

bool SessionPasswordCache::has(const std::string& address) const {
    std::lock_guard<std::mutex> lk(mu_);
    return cache_.count(to_lower(address)) != 0;
}

size_t SessionPasswordCache::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return cache_.size();
}

bool SessionPasswordCache::remove(const std::string& address) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = cache_.find(to_lower(address));
    if (it == cache_.end()) return false;
    secure_wipe(it->second);
    cache_.erase(it);
    return true;
}

void SessionPasswordCache::clear() {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto& kv : cache_) secure_wipe(kv.second);
    cache_.clear();
}

}
