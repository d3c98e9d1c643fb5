#pragma once
#include "errors.h"
#include "http_client.h"
#include "json.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace tollgate {

enum class FacilitatorFault { UNAUTHORIZED, RATE_LIMITED, REJECTED, MALFORMED, TRANSPORT };
const char* facilitator_fault_to_string(FacilitatorFault f);

class FacilitatorError : public EngineError {
public:
    FacilitatorError(ErrorCode code, FacilitatorFault fault, int http_status, const std::string& detail)
        : EngineError(code, detail), fault_(fault), http_status_(http_status) {}
    FacilitatorFault fault() const { return fault_; }
    int http_status() const { return http_status_; }
private:
    FacilitatorFault fault_;
    int http_status_;
};

struct DomainInfo {
    std::string name;
    std::string version;
    std::string verifying_contract;
    JNode       extra;  // the matched kind's extra object, passed through into requirements
};

struct VerifyResult {
    bool        is_valid{false};
    std::string invalid_reason;
    std::string payer;
};

struct SettleResult {
    std::string tx_hash;
    std::string network;
    std::string payer;
};

static constexpr int64_t SUPPORTED_CACHE_TTL_MS = 3600000;

// Client for a facilitator's /supported, /verify and /settle endpoints.
// Every base URL passes assert_allowed_url before any request is made.
class FacilitatorClient {
public:
    explicit FacilitatorClient(HttpTransport& http, int timeout_ms = 30000,
                               int64_t cache_ttl_ms = SUPPORTED_CACHE_TTL_MS);

    // /supported responses are cached per base URL and site key.
    DomainInfo get_supported(const std::string& url, const std::string& site_key, const std::string& network);
    VerifyResult verify(const std::string& url, const std::string& site_key,
                        const JNode& payload, const JNode& requirements);
    // success=false throws SETTLE_FAILED carrying the remote errorReason.
    SettleResult settle(const std::string& url, const std::string& site_key,
                        const JNode& payload, const JNode& requirements);

    void clear_cache();
    size_t cache_size() const;

private:
    struct CacheEntry {
        int64_t fetched_at_ms{0};
        JNode   body;
    };

    JNode fetch_supported(const std::string& base, const std::string& site_key);
    JNode post(const std::string& base, const std::string& endpoint, const std::string& site_key,
               const JNode& body, ErrorCode on_error);

    HttpTransport& http_;
    int timeout_ms_;
    int64_t cache_ttl_ms_;
    mutable std::mutex mu_;
    std::map<std::string, CacheEntry> cache_;
};

// Trailing slashes removed.
std::string normalize_base_url(const std::string& url);

}
