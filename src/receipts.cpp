#include "receipts.h"
#include "log.h"
#include "networks.h"
#include "util.h"
#include "crypto/secure_random.h"

#include <algorithm>

namespace tollgate {

const char* ap2_stage_to_string(Ap2Stage s) {
    switch (s) {
        case Ap2Stage::INTENT:   return "intent";
        case Ap2Stage::SETTLED:  return "settled";
        case Ap2Stage::DECLINED: return "declined";
    }
    return "intent";
}

bool ap2_stage_from_string(const std::string& s, Ap2Stage& out) {
    if (s == "intent") out = Ap2Stage::INTENT;
    else if (s == "settled") out = Ap2Stage::SETTLED;
    else if (s == "declined") out = Ap2Stage::DECLINED;
    else return false;
    return true;
}

static Receipt base_receipt(Ap2Stage stage, const std::string& url, const std::string& agent_id,
                            const AuthorizationContext& auth) {
    Receipt r;
    r.id = random_uuid();
    r.timestamp = iso8601_utc(now_ms());
    r.stage = stage;
    r.url = url;
    r.agent_id = agent_id;
    r.authorization = auth;
    return r;
}

Receipt make_intent_receipt(const std::string& url, const std::string& agent_id,
                            const AuthorizationContext& auth) {
    return base_receipt(Ap2Stage::INTENT, url, agent_id, auth);
}

Receipt make_settled_receipt(const std::string& url, const std::string& agent_id,
                             const AuthorizationContext& auth, const SettlementContext& settlement) {
    Receipt r = base_receipt(Ap2Stage::SETTLED, url, agent_id, auth);
    r.has_settlement = true;
    r.settlement = settlement;
    if (!settlement.tx_hash.empty() && settlement.tx_hash != UNKNOWN_TX_HASH) {
        r.has_verification = true;
        r.explorer_url = explorer_url(settlement.network, settlement.tx_hash);
        r.verification_network = settlement.network;
    }
    return r;
}

Receipt make_declined_receipt(const std::string& url, const std::string& agent_id,
                              const AuthorizationContext& auth, const DeclineContext& decline) {
    Receipt r = base_receipt(Ap2Stage::DECLINED, url, agent_id, auth);
    r.has_decline = true;
    r.decline = decline;
    return r;
}

static JNode str_or_null(const std::string& s) {
    return s.empty() ? jnull() : jstr(s);
}

JNode receipt_to_json(const Receipt& r) {
    JObject auth;
    auth["perRequestLimit"] = str_or_null(r.authorization.per_request_limit);
    auth["dailyLimit"] = str_or_null(r.authorization.daily_limit);
    auth["totalLimit"] = str_or_null(r.authorization.total_limit);
    auth["dailySpent"] = jstr(r.authorization.daily_spent);
    auth["totalSpent"] = jstr(r.authorization.total_spent);
    auth["requestedAmount"] = jstr(r.authorization.requested_amount);
    auth["authorizedAt"] = jstr(r.authorization.authorized_at);
    auth["expiresAt"] = str_or_null(r.authorization.expires_at);

    JObject o;
    o["id"] = jstr(r.id);
    o["timestamp"] = jstr(r.timestamp);
    o["ap2Stage"] = jstr(ap2_stage_to_string(r.stage));
    o["url"] = jstr(r.url);
    o["agentId"] = str_or_null(r.agent_id);
    o["authorization"] = jobj(std::move(auth));

    if (r.has_settlement) {
        JObject s;
        s["txHash"] = jstr(r.settlement.tx_hash);
        s["network"] = jstr(r.settlement.network);
        s["amount"] = jstr(r.settlement.amount);
        s["amountFormatted"] = jstr(r.settlement.amount_formatted);
        s["currency"] = jstr(r.settlement.currency);
        s["payer"] = jstr(r.settlement.payer);
        s["payee"] = jstr(r.settlement.payee);
        o["settlement"] = jobj(std::move(s));
    } else {
        o["settlement"] = jnull();
    }

    if (r.has_decline) {
        JObject d;
        d["reason"] = jstr(r.decline.reason);
        d["limit"] = jstr(r.decline.limit);
        d["limitValue"] = jstr(r.decline.limit_value);
        d["requestedAmount"] = str_or_null(r.decline.requested_amount);
        o["decline"] = jobj(std::move(d));
    } else {
        o["decline"] = jnull();
    }

    if (r.has_verification) {
        JObject v;
        v["explorerUrl"] = jstr(r.explorer_url);
        v["network"] = jstr(r.verification_network);
        o["verification"] = jobj(std::move(v));
    } else {
        o["verification"] = jnull();
    }
    return jobj(std::move(o));
}

bool receipt_from_json(const JNode& j, Receipt& out) {
    if (!json_is_object(j)) return false;
    Receipt r;
    if (!json_get_string(j, "id", r.id) || !json_get_string(j, "timestamp", r.timestamp)) return false;
    if (!ap2_stage_from_string(json_string_or(j, "ap2Stage"), r.stage)) return false;
    r.url = json_string_or(j, "url");
    r.agent_id = json_string_or(j, "agentId");

    if (const JNode* a = json_get(j, "authorization")) {
        r.authorization.per_request_limit = json_string_or(*a, "perRequestLimit");
        r.authorization.daily_limit = json_string_or(*a, "dailyLimit");
        r.authorization.total_limit = json_string_or(*a, "totalLimit");
        r.authorization.daily_spent = json_string_or(*a, "dailySpent", "0.00");
        r.authorization.total_spent = json_string_or(*a, "totalSpent", "0.00");
        r.authorization.requested_amount = json_string_or(*a, "requestedAmount", "0.00");
        r.authorization.authorized_at = json_string_or(*a, "authorizedAt");
        r.authorization.expires_at = json_string_or(*a, "expiresAt");
    }
    const JNode* s = json_get(j, "settlement");
    if (s && json_is_object(*s)) {
        r.has_settlement = true;
        r.settlement.tx_hash = json_string_or(*s, "txHash");
        r.settlement.network = json_string_or(*s, "network");
        r.settlement.amount = json_string_or(*s, "amount");
        r.settlement.amount_formatted = json_string_or(*s, "amountFormatted");
        r.settlement.currency = json_string_or(*s, "currency");
        r.settlement.payer = json_string_or(*s, "payer");
        r.settlement.payee = json_string_or(*s, "payee");
    }
    const JNode* d = json_get(j, "decline");
    if (d && json_is_object(*d)) {
        r.has_decline = true;
        r.decline.reason = json_string_or(*d, "reason");
        r.decline.limit = json_string_or(*d, "limit");
        r.decline.limit_value = json_string_or(*d, "limitValue");
        r.decline.requested_amount = json_string_or(*d, "requestedAmount");
    }
    const JNode* v = json_get(j, "verification");
    if (v && json_is_object(*v)) {
        r.has_verification = true;
        r.explorer_url = json_string_or(*v, "explorerUrl");
        r.verification_network = json_string_or(*v, "network");
    }
    out = std::move(r);
    return true;
}

bool ReceiptLog::append(const Receipt& r) {
    std::string err;
    if (!store_.append_line(RECEIPTS_FILE, json_dump(receipt_to_json(r)), err)) {
        log_warn(LogCategory::STORAGE, "failed to write receipt: " + err);
        return false;
    }
    TOLLGATE_LOG_DEBUG(LogCategory::STORAGE, std::string("receipt ") + r.id + " (" + ap2_stage_to_string(r.stage) + ")");
    return true;
}

std::vector<Receipt> ReceiptLog::all() const {
    std::vector<Receipt> out;
    for (const std::string& line : store_.lines(RECEIPTS_FILE)) {
        JNode j;
        Receipt r;
        if (json_parse(line, j) && receipt_from_json(j, r)) out.push_back(std::move(r));
    }
    return out;
}

ReceiptPage ReceiptLog::list(const ReceiptFilter& f) const {
    int64_t start_ms = 0, end_ms = 0;
    const bool has_start = !f.start.empty() && parse_iso8601_utc(f.start, start_ms);
    const bool has_end = !f.end.empty() && parse_iso8601_utc(f.end, end_ms);

    std::vector<Receipt> matched;
    for (auto& r : all()) {
        if (f.has_stage && r.stage != f.stage) continue;
        if (!f.agent_id.empty() && r.agent_id != f.agent_id) continue;
        if (has_start || has_end) {
            int64_t ts = 0;
            if (!parse_iso8601_utc(r.timestamp, ts)) continue;
            if (has_start && ts < start_ms) continue;
            if (has_end && ts > end_ms) continue;
        }
        matched.push_back(std::move(r));
    }
    std::reverse(matched.begin(), matched.end());

    ReceiptPage page;
    page.total = matched.size();
    const size_t begin = std::min(f.offset, matched.size());
    const size_t stop = std::min(begin + f.limit, matched.size());
    page.receipts.assign(std::make_move_iterator(matched.begin() + begin),
                         std::make_move_iterator(matched.begin() + stop));
    page.has_more = f.offset + f.limit < page.total;
    return page;
}

bool ReceiptLog::get(const std::string& id, Receipt& out) const {
    for (auto& r : all()) {
        if (r.id == id) { out = std::move(r); return true; }
    }
    return false;
}

}
