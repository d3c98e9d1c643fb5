#include "history.h"
#include "amount.h"
#include "errors.h"
#include "log.h"
#include "util.h"

#include <algorithm>

namespace tollgate {

const char* entry_status_to_string(EntryStatus s) {
    switch (s) {
        case EntryStatus::NONE:      return "";
        case EntryStatus::PENDING:   return "pending";
        case EntryStatus::CONFIRMED: return "confirmed";
        case EntryStatus::FAILED:    return "failed";
    }
    return "";
}

static EntryStatus entry_status_from_string(const std::string& s) {
    if (s == "pending") return EntryStatus::PENDING;
    if (s == "confirmed") return EntryStatus::CONFIRMED;
    if (s == "failed") return EntryStatus::FAILED;
    return EntryStatus::NONE;
}

JNode ledger_entry_to_json(const LedgerEntry& e) {
    JObject o;
    o["ts"] = jstr(e.ts);
    o["url"] = jstr(e.url);
    o["amount"] = jstr(e.amount);
    o["asset"] = jstr(e.asset);
    o["network"] = jstr(e.network);
    o["txHash"] = jstr(e.tx_hash);
    o["mode"] = jstr(e.mode);
    if (!e.request_id.empty()) o["requestId"] = jstr(e.request_id);
    if (e.status != EntryStatus::NONE) o["status"] = jstr(entry_status_to_string(e.status));
    if (!e.error.empty()) o["error"] = jstr(e.error);
    if (!e.settled_at.empty()) o["settledAt"] = jstr(e.settled_at);
    return jobj(std::move(o));
}

bool ledger_entry_from_json(const JNode& j, LedgerEntry& out) {
    if (!json_is_object(j)) return false;
    LedgerEntry e;
    if (!json_get_string(j, "ts", e.ts) || !json_get_string(j, "amount", e.amount)) return false;
    e.url = json_string_or(j, "url");
    e.asset = json_string_or(j, "asset");
    e.network = json_string_or(j, "network");
    e.tx_hash = json_string_or(j, "txHash");
    e.mode = json_string_or(j, "mode");
    e.request_id = json_string_or(j, "requestId");
    e.status = entry_status_from_string(json_string_or(j, "status"));
    e.error = json_string_or(j, "error");
    e.settled_at = json_string_or(j, "settledAt");
    out = std::move(e);
    return true;
}

SpendingLedger::SpendingLedger(BlobStore& store)
    : store_(store), lock_(store.root()) {}

static std::vector<LedgerEntry> parse_lines(const std::vector<std::string>& lines) {
    std::vector<LedgerEntry> out;
    out.reserve(lines.size());
    for (const std::string& l : lines) {
        JNode j;
        LedgerEntry e;
        if (json_parse(l, j) && ledger_entry_from_json(j, e)) {
            out.push_back(std::move(e));
        } else {
            TOLLGATE_LOG_DEBUG(LogCategory::STORAGE, "skipping malformed history line");
        }
    }
    return out;
}

void SpendingLedger::append(const LedgerEntry& e) {
    std::lock_guard<std::mutex> lk(mu_);
    FileLock::Guard g = lock_.acquire("history");
    std::string err;
    if (!store_.append_line(HISTORY_FILE, json_dump(ledger_entry_to_json(e)), err)) {
        throw EngineError(ErrorCode::STORAGE_ERROR, "history append failed: " + err);
    }
}

// Drops the oldest unconfirmed entries beyond the cap. Counted spend is kept.
static void trim_unconfirmed(std::vector<LedgerEntry>& entries) {
    size_t unconfirmed = 0;
    for (const auto& e : entries) {
        if (e.status == EntryStatus::PENDING || e.status == EntryStatus::FAILED) ++unconfirmed;
    }
    if (unconfirmed <= MAX_UNCONFIRMED_ENTRIES) return;
    size_t excess = unconfirmed - MAX_UNCONFIRMED_ENTRIES;
    std::vector<LedgerEntry> kept;
    kept.reserve(entries.size() - excess);
    for (auto& e : entries) {
        if (excess > 0 && e.status == EntryStatus::FAILED) {
            --excess;
            continue;
        }
        kept.push_back(std::move(e));
    }
    entries.swap(kept);
}

bool SpendingLedger::update_status(const std::string& request_id, EntryStatus status,
                                   const std::string& tx_hash, const std::string& error) {
    if (request_id.empty()) return false;
    std::lock_guard<std::mutex> lk(mu_);
    FileLock::Guard g = lock_.acquire("history");

    std::vector<LedgerEntry> all = parse_lines(store_.lines(HISTORY_FILE));
    bool updated = false;
    for (auto& e : all) {
        if (e.request_id != request_id || e.status != EntryStatus::PENDING) continue;
        e.status = status;
        if (status == EntryStatus::CONFIRMED) {
            e.tx_hash = tx_hash;
            e.settled_at = iso8601_utc(now_ms());
            e.error.clear();
        } else if (status == EntryStatus::FAILED) {
            e.error = error;
        }
        updated = true;
        break;
    }
    if (!updated) return false;

    trim_unconfirmed(all);
    std::string data;
    for (const auto& e : all) {
        data += json_dump(ledger_entry_to_json(e));
        data += '\n';
    }
    std::string err;
    if (!store_.put(HISTORY_FILE, data, err)) {
        throw EngineError(ErrorCode::STORAGE_ERROR, "history rewrite failed: " + err);
    }
    TOLLGATE_LOG_DEBUG(LogCategory::STORAGE, "history entry " + request_id + " -> " + entry_status_to_string(status));
    return true;
}

std::vector<LedgerEntry> SpendingLedger::entries() const {
    std::lock_guard<std::mutex> lk(mu_);
    return parse_lines(store_.lines(HISTORY_FILE));
}

std::vector<LedgerEntry> SpendingLedger::recent(size_t n) const {
    std::vector<LedgerEntry> all = entries();
    std::reverse(all.begin(), all.end());
    if (all.size() > n) all.resize(n);
    return all;
}

bool SpendingLedger::find(const std::string& request_id, LedgerEntry& out) const {
    for (auto& e : entries()) {
        if (e.request_id == request_id) { out = e; return true; }
    }
    return false;
}

SpendingTotals compute_totals(const std::vector<LedgerEntry>& entries, int64_t at_ms) {
    const int64_t day_start = utc_day_start_ms(at_ms);
    Amount today, lifetime;
    for (const auto& e : entries) {
        if (!e.counts()) continue;
        Amount a;
        if (!Amount::parse(e.amount, a)) continue;
        lifetime += a;
        int64_t ts = 0;
        if (parse_iso8601_utc(e.ts, ts) && ts >= day_start) today += a;
    }
    SpendingTotals t;
    t.today = today.to_string();
    t.lifetime = lifetime.to_string();
    return t;
}

SpendingTotals SpendingLedger::totals(int64_t at_ms) const {
    return compute_totals(entries(), at_ms);
}

SpendingTotals SpendingLedger::totals() const {
    return totals(now_ms());
}

}
