#pragma once
#include "budget.h"
#include "errors.h"
#include "facilitator.h"
#include "history.h"
#include "http_client.h"
#include "pending_settlements.h"
#include "receipts.h"
#include "signal_detector.h"
#include "wallet/key_cache.h"
#include "wallet/wallet_file.h"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace tollgate {

static constexpr int64_t RECOVERY_TIMEOUT_MS = 60000;

struct FetchOptions {
    std::string max_price;     // decimal USDC; empty = rely on the stored budget
    std::string network;       // when set, the offer must be on this network
    int         timeout_ms{30000};
    bool        optimistic{false};  // client mode only, and only if the page allows it
    std::string context;       // duplicate-payment key; defaults to the URL
    std::string agent_id;      // overrides EngineSettings::agent_id on receipts
};

struct PaymentInfo {
    PaymentMode mode{PaymentMode::CLIENT};
    std::string amount;            // smallest unit
    std::string amount_formatted;  // USDC
    std::string asset;
    std::string network;
    std::string tx_hash;           // empty while an optimistic settlement is pending
    std::string pay_to;
    std::string payer;
    std::string request_id;        // optimistic only
    bool        pending{false};
};

struct FetchResult {
    bool        ok{false};
    std::string url;
    int         status_code{0};
    std::string content_type;
    std::string content;
    bool        has_payment{false};
    PaymentInfo payment;

    ErrorCode    error{ErrorCode::NONE};
    std::string  message;
    std::string  requested_amount;  // smallest unit, budget declines only
    BudgetReason budget_reason{BudgetReason::NONE};

    std::string receipt_id;         // empty when receipts are disabled
};

enum class SettlementEventKind { PROVISIONAL, CONFIRMED, FAILED };
const char* settlement_event_to_string(SettlementEventKind k);

struct SettlementEvent {
    SettlementEventKind kind{SettlementEventKind::PROVISIONAL};
    std::string request_id;
    std::string url;
    std::string context;
    PaymentInfo payment;
    std::string error;
};

using SettlementListener = std::function<void(const SettlementEvent&)>;

struct EngineSettings {
    bool        skip_verify{false};
    bool        record_receipts{true};
    std::string agent_id;
    int         lock_timeout_ms{5000};
};

// Fetch, detect, budget-gate, sign, settle. Persistent state lives in `store`;
// network access goes through `http`. Optimistic settlements run on background
// threads; finished ones are joined when the next one starts, the rest by
// wait_idle() and by the destructor.
//
// While a background settlement runs, its worker holds the file lock
// "settle-<requestId>" so other processes sharing the data directory can tell
// a live settlement from one orphaned by a crash.
class PaymentEngine {
public:
    PaymentEngine(BlobStore& store, HttpTransport& http, Wallet& wallet,
                  EngineSettings settings = EngineSettings());
    ~PaymentEngine();
    PaymentEngine(const PaymentEngine&) = delete;
    PaymentEngine& operator=(const PaymentEngine&) = delete;

    // Never throws for payment outcomes; failures come back as ok=false.
    FetchResult fetch_with_payment(const std::string& url, const FetchOptions& opts = FetchOptions());

    // Startup sweep: every persisted pending marker whose owner is gone becomes
    // a failed ledger entry, the listener hears about it, and that marker is
    // removed. Markers of settlements still running elsewhere are left alone.
    // Returns the number of ledger entries changed.
    size_t recover_pending();

    void set_listener(SettlementListener listener);
    void wait_idle();
    bool in_progress(const std::string& context) const;
    // Background threads not yet joined. Finished threads are reaped first.
    size_t active_workers();

    KeyCache&          key_cache()   { return keys_; }
    SpendingLedger&    ledger()      { return ledger_; }
    BudgetStore&       budgets()     { return budgets_; }
    ReceiptLog&        receipts()    { return receipts_; }
    FacilitatorClient& facilitator() { return facilitator_; }
    PendingSettlements& pending()    { return pending_; }

private:
    struct Job;
    class InProgressMark;

    FetchResult run(const std::string& url, const FetchOptions& opts);
    FetchResult handle_inline(const std::string& url, const FetchOptions& opts, const HttpResponse& page,
                              const PaymentOffer& offer);
    FetchResult handle_402(const std::string& url, const FetchOptions& opts, const PaymentOffer& offer);

    void settle_in_background(Job job);
    void complete_job(Job& job);
    void finish_worker(uint64_t seq);
    void reap_finished_locked();
    bool owner_alive(const std::string& request_id) const;

    std::shared_ptr<const ResolvedKey> signing_key();
    void notify(const SettlementEvent& ev);
    bool mark_in_progress(const std::string& context);
    void clear_in_progress(const std::string& context);

    AuthorizationContext snapshot_authorization(const std::string& max_price) const;
    void record_receipt(FetchResult& r, const std::string& agent_id, AuthorizationContext auth);

    BlobStore&         store_;
    HttpTransport&     http_;
    Wallet&            wallet_;
    EngineSettings     settings_;
    FileLock           lock_;
    SpendingLedger     ledger_;
    BudgetStore        budgets_;
    ReceiptLog         receipts_;
    PendingSettlements pending_;
    FacilitatorClient  facilitator_;
    KeyCache           keys_;

    mutable std::mutex mu_;
    std::set<std::string> in_progress_;
    SettlementListener listener_;
    std::map<uint64_t, std::thread> workers_;
    std::vector<uint64_t> finished_;
    uint64_t next_worker_{0};
};

}
