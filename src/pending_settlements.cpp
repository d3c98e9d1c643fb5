#include "pending_settlements.h"
#include "errors.h"
#include "log.h"

namespace tollgate {

PendingSettlements::PendingSettlements(BlobStore& store)
    : store_(store), lock_(store.root()) {}

static JNode to_json(const PendingSettlement& p) {
    JObject o;
    o["requestId"] = jstr(p.request_id);
    o["context"] = jstr(p.context);
    o["url"] = jstr(p.url);
    o["facilitatorUrl"] = jstr(p.facilitator_url);
    o["siteKey"] = jstr(p.site_key);
    o["paymentPayload"] = p.payload;
    o["paymentRequirements"] = p.requirements;
    o["signedAt"] = jnum(static_cast<double>(p.signed_at_ms));
    return jobj(std::move(o));
}

static bool from_json(const JNode& j, PendingSettlement& out) {
    if (!json_get_string(j, "requestId", out.request_id)) return false;
    out.context = json_string_or(j, "context");
    out.url = json_string_or(j, "url");
    out.facilitator_url = json_string_or(j, "facilitatorUrl");
    out.site_key = json_string_or(j, "siteKey");
    if (const JNode* p = json_get(j, "paymentPayload")) out.payload = *p;
    if (const JNode* r = json_get(j, "paymentRequirements")) out.requirements = *r;
    double signed_at = 0;
    json_get_number(j, "signedAt", signed_at);
    out.signed_at_ms = static_cast<int64_t>(signed_at);
    return true;
}

JObject PendingSettlements::load() const {
    std::string raw;
    if (!store_.get(PENDING_FILE, raw)) return JObject{};
    JNode j;
    if (!json_parse(raw, j) || !json_is_object(j)) {
        log_warn(LogCategory::STORAGE, "pending.json unreadable; treating as empty");
        return JObject{};
    }
    return std::get<JObject>(j.v);
}

void PendingSettlements::save(const JObject& table) {
    std::string err;
    if (table.empty()) {
        if (!store_.del(PENDING_FILE, err)) throw EngineError(ErrorCode::STORAGE_ERROR, "pending.json: " + err);
        return;
    }
    if (!store_.put(PENDING_FILE, json_dump(jobj(table)), err)) {
        throw EngineError(ErrorCode::STORAGE_ERROR, "pending.json: " + err);
    }
}

void PendingSettlements::add(const PendingSettlement& p) {
    std::lock_guard<std::mutex> lk(mu_);
    FileLock::Guard g = lock_.acquire("pending");
    JObject table = load();
    table[p.request_id] = to_json(p);
    save(table);
}

bool PendingSettlements::remove(const std::string& request_id) {
    std::lock_guard<std::mutex> lk(mu_);
    FileLock::Guard g = lock_.acquire("pending");
    JObject table = load();
    if (table.erase(request_id) == 0) return false;
    save(table);
    return true;
}

std::vector<PendingSettlement> PendingSettlements::all() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<PendingSettlement> out;
    for (const auto& kv : load()) {
        PendingSettlement p;
        if (from_json(kv.second, p)) out.push_back(std::move(p));
    }
    return out;
}

std::vector<PendingSettlement> PendingSettlements::reclaim(
        const std::function<bool(const PendingSettlement&)>& owner_alive,
        const std::function<void(const PendingSettlement&)>& resolve) {
    std::lock_guard<std::mutex> lk(mu_);
    FileLock::Guard g = lock_.acquire("pending");
    JObject table = load();
    std::vector<PendingSettlement> dropped;
    bool changed = false;
    for (auto it = table.begin(); it != table.end();) {
        PendingSettlement p;
        if (!from_json(it->second, p)) {
            log_warn(LogCategory::STORAGE, "dropping unreadable pending marker " + it->first);
            it = table.erase(it);
            changed = true;
            continue;
        }
        if (owner_alive(p)) {
            ++it;
            continue;
        }
        resolve(p);
        it = table.erase(it);
        changed = true;
        dropped.push_back(std::move(p));
    }
    if (changed) save(table);
    return dropped;
}

}
