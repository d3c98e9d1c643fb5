#include "facilitator.h"
#include "log.h"
#include "url.h"
#include "util.h"

namespace tollgate {

const char* facilitator_fault_to_string(FacilitatorFault f) {
    switch (f) {
        case FacilitatorFault::UNAUTHORIZED: return "Unauthorized";
        case FacilitatorFault::RATE_LIMITED: return "RateLimited";
        case FacilitatorFault::REJECTED:     return "Rejected";
        case FacilitatorFault::MALFORMED:    return "Malformed";
        case FacilitatorFault::TRANSPORT:    return "Transport";
    }
    return "Rejected";
}

std::string normalize_base_url(const std::string& url) {
    std::string s = url;
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

FacilitatorClient::FacilitatorClient(HttpTransport& http, int timeout_ms, int64_t cache_ttl_ms)
    : http_(http), timeout_ms_(timeout_ms), cache_ttl_ms_(cache_ttl_ms) {}

static void add_auth(HttpRequest& req, const std::string& site_key) {
    if (!site_key.empty()) req.headers.emplace_back("Authorization", "Bearer " + site_key);
}

// Non-2xx to a typed error. The body's `error` string, when present, is the message.
static FacilitatorError http_failure(ErrorCode code, const std::string& endpoint, const HttpResponse& resp) {
    FacilitatorFault fault = FacilitatorFault::REJECTED;
    if (resp.code == 401) fault = FacilitatorFault::UNAUTHORIZED;
    else if (resp.code == 429) fault = FacilitatorFault::RATE_LIMITED;

    std::string msg = "Facilitator " + endpoint + " failed: HTTP " + std::to_string(resp.code);
    JNode body;
    std::string remote;
    if (json_parse(resp.body, body) && json_get_string(body, "error", remote) && !remote.empty()) {
        msg = remote;
    }
    return FacilitatorError(code, fault, resp.code,
                            std::string(facilitator_fault_to_string(fault)) + ": " + msg);
}

JNode FacilitatorClient::fetch_supported(const std::string& base, const std::string& site_key) {
    HttpRequest req;
    req.method = "GET";
    req.url = base + "/supported";
    req.timeout_ms = timeout_ms_;
    add_auth(req, site_key);

    HttpResponse resp;
    std::string err;
    if (!http_.send(req, resp, err)) {
        throw FacilitatorError(ErrorCode::FACILITATOR_ERROR, FacilitatorFault::TRANSPORT, 0,
                               "Facilitator /supported failed: " + err);
    }
    if (resp.code < 200 || resp.code > 299) throw http_failure(ErrorCode::FACILITATOR_ERROR, "/supported", resp);

    JNode body;
    if (!json_parse(resp.body, body) || !json_is_object(body)) {
        throw FacilitatorError(ErrorCode::FACILITATOR_ERROR, FacilitatorFault::MALFORMED, resp.code,
                               "Facilitator /supported returned invalid JSON");
    }
    return body;
}

DomainInfo FacilitatorClient::get_supported(const std::string& url, const std::string& site_key,
                                            const std::string& network) {
    assert_allowed_url(url, "Facilitator URL");
    const std::string base = normalize_base_url(url);
    const std::string key = base + "|" + site_key;

    JNode body;
    bool hit = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = cache_.find(key);
        if (it != cache_.end() && now_ms() - it->second.fetched_at_ms < cache_ttl_ms_) {
            body = it->second.body;
            hit = true;
        }
    }
    if (!hit) {
        body = fetch_supported(base, site_key);
        std::lock_guard<std::mutex> lk(mu_);
        CacheEntry& e = cache_[key];
        e.fetched_at_ms = now_ms();
        e.body = body;
    } else {
        TOLLGATE_LOG_DEBUG(LogCategory::FACILITATOR, "/supported cache hit for " + base);
    }

    const JNode* kinds = json_get(body, "kinds");
    if (kinds && json_is_array(*kinds)) {
        for (const JNode& kind : std::get<JArray>(kinds->v)) {
            std::string kind_network, scheme;
            if (!json_get_string(kind, "network", kind_network) || kind_network != network) continue;
            if (!json_get_string(kind, "scheme", scheme) || scheme != "exact") continue;

            const JNode* extra = json_get(kind, "extra");
            if (!extra || !json_is_object(*extra)) {
                throw FacilitatorError(ErrorCode::FACILITATOR_ERROR, FacilitatorFault::MALFORMED, 200,
                                       "No EIP-712 domain info for network " + network);
            }
            DomainInfo d;
            d.name = json_string_or(*extra, "name");
            d.version = json_string_or(*extra, "version");
            d.verifying_contract = json_string_or(*extra, "asset");
            if (d.verifying_contract.empty()) d.verifying_contract = json_string_or(*extra, "verifyingContract");
            d.extra = *extra;
            return d;
        }
    }
    throw FacilitatorError(ErrorCode::FACILITATOR_ERROR, FacilitatorFault::MALFORMED, 200,
                           "No supported kind found for network " + network);
}

JNode FacilitatorClient::post(const std::string& base, const std::string& endpoint, const std::string& site_key,
                              const JNode& body, ErrorCode on_error) {
    HttpRequest req;
    req.method = "POST";
    req.url = base + endpoint;
    req.timeout_ms = timeout_ms_;
    req.headers.emplace_back("Content-Type", "application/json");
    add_auth(req, site_key);
    req.body = json_dump(body);

    HttpResponse resp;
    std::string err;
    if (!http_.send(req, resp, err)) {
        throw FacilitatorError(on_error, FacilitatorFault::TRANSPORT, 0,
                               "Facilitator " + endpoint + " failed: " + err);
    }
    if (resp.code < 200 || resp.code > 299) throw http_failure(on_error, endpoint, resp);

    JNode out;
    if (!json_parse(resp.body, out) || !json_is_object(out)) {
        throw FacilitatorError(on_error, FacilitatorFault::MALFORMED, resp.code,
                               "Facilitator " + endpoint + " returned invalid JSON");
    }
    return out;
}

static JNode settle_body(const JNode& payload, const JNode& requirements) {
    JObject o;
    o["paymentPayload"] = payload;
    o["paymentRequirements"] = requirements;
    return jobj(std::move(o));
}

VerifyResult FacilitatorClient::verify(const std::string& url, const std::string& site_key,
                                       const JNode& payload, const JNode& requirements) {
    assert_allowed_url(url, "Facilitator URL");
    const JNode resp = post(normalize_base_url(url), "/verify", site_key,
                            settle_body(payload, requirements), ErrorCode::FACILITATOR_ERROR);
    VerifyResult r;
    json_get_bool(resp, "isValid", r.is_valid);
    r.invalid_reason = json_string_or(resp, "invalidReason");
    r.payer = json_string_or(resp, "payer");
    return r;
}

SettleResult FacilitatorClient::settle(const std::string& url, const std::string& site_key,
                                       const JNode& payload, const JNode& requirements) {
    assert_allowed_url(url, "Facilitator URL");
    const JNode resp = post(normalize_base_url(url), "/settle", site_key,
                            settle_body(payload, requirements), ErrorCode::SETTLE_FAILED);
    bool success = false;
    json_get_bool(resp, "success", success);
    if (!success) {
        std::string reason = json_string_or(resp, "errorReason");
        if (reason.empty()) reason = json_string_or(resp, "errorMessage", "unknown");
        throw FacilitatorError(ErrorCode::SETTLE_FAILED, FacilitatorFault::REJECTED, 200,
                               "Settlement failed: " + reason);
    }
    SettleResult r;
    r.tx_hash = json_string_or(resp, "transaction");
    r.network = json_string_or(resp, "network");
    r.payer = json_string_or(resp, "payer");
    log_info(LogCategory::FACILITATOR, "settled " + r.tx_hash + " on " + r.network);
    return r;
}

void FacilitatorClient::clear_cache() {
    std::lock_guard<std::mutex> lk(mu_);
    cache_.clear();
}

size_t FacilitatorClient::cache_size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return cache_.size();
}

}
