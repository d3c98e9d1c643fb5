#pragma once
#include "blob_store.h"
#include "file_lock.h"
#include "json.h"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace tollgate {

static constexpr const char* HISTORY_FILE = "history.jsonl";
static constexpr size_t MAX_UNCONFIRMED_ENTRIES = 10000;

// NONE: entry written before settlement tracking existed; counts as confirmed.
enum class EntryStatus { NONE, PENDING, CONFIRMED, FAILED };
const char* entry_status_to_string(EntryStatus s);

struct LedgerEntry {
    std::string ts;        // ISO-8601 UTC
    std::string url;
    std::string amount;    // smallest unit
    std::string asset;
    std::string network;
    std::string tx_hash;
    std::string mode;      // "client" | "server" | "402"
    std::string request_id;
    EntryStatus status{EntryStatus::NONE};
    std::string error;
    std::string settled_at;

    // Spend that counts against budgets: everything except failed settlements.
    bool counts() const { return status != EntryStatus::FAILED; }
};

JNode ledger_entry_to_json(const LedgerEntry& e);
bool ledger_entry_from_json(const JNode& j, LedgerEntry& out);

struct SpendingTotals {
    std::string today{"0"};     // smallest unit, since UTC midnight
    std::string lifetime{"0"};
};

// Append-only spending log, one JSON object per line. Status updates rewrite
// the file under the "history" lock.
class SpendingLedger {
public:
    explicit SpendingLedger(BlobStore& store);

    // Throws EngineError(STORAGE_ERROR).
    void append(const LedgerEntry& e);

    // Applies only to a PENDING entry with this request id. Returns false when
    // no such entry exists, which makes repeated completions a no-op.
    bool update_status(const std::string& request_id, EntryStatus status,
                       const std::string& tx_hash, const std::string& error);

    // Oldest first; malformed lines are skipped.
    std::vector<LedgerEntry> entries() const;
    // Newest first, at most n.
    std::vector<LedgerEntry> recent(size_t n) const;
    bool find(const std::string& request_id, LedgerEntry& out) const;

    SpendingTotals totals(int64_t at_ms) const;
    SpendingTotals totals() const;

private:
    BlobStore& store_;
    FileLock lock_;
    mutable std::mutex mu_;
};

// Pure: sums over `entries` using the same rules as SpendingLedger::totals.
SpendingTotals compute_totals(const std::vector<LedgerEntry>& entries, int64_t at_ms);

}
