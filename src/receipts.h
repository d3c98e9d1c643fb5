#pragma once
#include "blob_store.h"
#include "json.h"

#include <cstdint>
#include <string>
#include <vector>

namespace tollgate {

static constexpr const char* RECEIPTS_FILE = "receipts.jsonl";

enum class Ap2Stage { INTENT, SETTLED, DECLINED };
const char* ap2_stage_to_string(Ap2Stage s);
bool ap2_stage_from_string(const std::string& s, Ap2Stage& out);

// Budget snapshot taken when the request was authorized. USDC decimal strings;
// empty limits and expiry serialize as null.
struct AuthorizationContext {
    std::string per_request_limit;
    std::string daily_limit;
    std::string total_limit;
    std::string daily_spent{"0.00"};
    std::string total_spent{"0.00"};
    std::string requested_amount{"0.00"};
    std::string authorized_at;
    std::string expires_at;
};

struct SettlementContext {
    std::string tx_hash;
    std::string network;
    std::string amount;            // smallest unit
    std::string amount_formatted;
    std::string currency;          // asset contract
    std::string payer;
    std::string payee;
};

struct DeclineContext {
    std::string reason;            // "budget_exceeded" | "max_price_exceeded" | "no_budget"
    std::string limit;             // per_request | daily | total | max_price | no_budget
    std::string limit_value;
    std::string requested_amount;  // empty serializes as null
};

struct Receipt {
    std::string id;
    std::string timestamp;
    Ap2Stage    stage{Ap2Stage::INTENT};
    std::string url;
    std::string agent_id;          // empty serializes as null
    AuthorizationContext authorization;
    bool has_settlement{false};
    SettlementContext settlement;
    bool has_decline{false};
    DeclineContext decline;
    bool has_verification{false};
    std::string explorer_url;
    std::string verification_network;
};

Receipt make_intent_receipt(const std::string& url, const std::string& agent_id,
                            const AuthorizationContext& auth);
// Placeholder recorded when a 402 retry succeeds without a settlement header.
static constexpr const char* UNKNOWN_TX_HASH = "unknown";

// Verification is attached when settlement carries a real transaction hash.
Receipt make_settled_receipt(const std::string& url, const std::string& agent_id,
                             const AuthorizationContext& auth, const SettlementContext& settlement);
Receipt make_declined_receipt(const std::string& url, const std::string& agent_id,
                              const AuthorizationContext& auth, const DeclineContext& decline);

JNode receipt_to_json(const Receipt& r);
bool receipt_from_json(const JNode& j, Receipt& out);

struct ReceiptFilter {
    bool        has_stage{false};
    Ap2Stage    stage{Ap2Stage::INTENT};
    std::string agent_id;
    std::string start;   // ISO-8601 or YYYY-MM-DD, inclusive
    std::string end;
    size_t      limit{100};
    size_t      offset{0};
};

struct ReceiptPage {
    std::vector<Receipt> receipts;  // newest first
    size_t total{0};
    bool   has_more{false};
};

class ReceiptLog {
public:
    explicit ReceiptLog(BlobStore& store) : store_(store) {}

    // A failed write is logged, never thrown: receipts must not fail a payment.
    bool append(const Receipt& r);
    ReceiptPage list(const ReceiptFilter& filter) const;
    bool get(const std::string& id, Receipt& out) const;

private:
    std::vector<Receipt> all() const;
    BlobStore& store_;
};

}
