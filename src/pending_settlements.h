#pragma once
#include "blob_store.h"
#include "file_lock.h"
#include "json.h"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace tollgate {

static constexpr const char* PENDING_FILE = "pending.json";

// Marker for an optimistic settlement that has been signed but not yet completed.
struct PendingSettlement {
    std::string request_id;
    std::string context;
    std::string url;
    std::string facilitator_url;
    std::string site_key;
    JNode       payload;
    JNode       requirements;
    int64_t     signed_at_ms{0};
};

// pending.json: {"<requestId>": {...}, ...}. Every mutation is a locked
// read-modify-write followed by an atomic replace.
class PendingSettlements {
public:
    explicit PendingSettlements(BlobStore& store);

    // Throws EngineError(STORAGE_ERROR).
    void add(const PendingSettlement& p);
    // False when the marker was already gone.
    bool remove(const std::string& request_id);
    std::vector<PendingSettlement> all() const;

    // Restart sweep under one hold of the "pending" lock. Markers for which
    // `owner_alive` is true are left alone; every other marker is passed to
    // `resolve` and then dropped. Returns the dropped markers.
    std::vector<PendingSettlement> reclaim(const std::function<bool(const PendingSettlement&)>& owner_alive,
                                           const std::function<void(const PendingSettlement&)>& resolve);

private:
    JObject load() const;
    void save(const JObject& table);

    BlobStore& store_;
    FileLock lock_;
    mutable std::mutex mu_;
};

}
