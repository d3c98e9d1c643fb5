#include "payment_engine.h"

#include "amount.h"
#include "base64.h"
#include "crypto/secure_random.h"
#include "hex.h"
#include "log.h"
#include "networks.h"
#include "publisher_client.h"
#include "signer.h"
#include "url.h"
#include "util.h"

#include <cctype>
#include <exception>
#include <utility>

namespace tollgate {

const char* settlement_event_to_string(SettlementEventKind k) {
    switch (k) {
        case SettlementEventKind::PROVISIONAL: return "provisional";
        case SettlementEventKind::CONFIRMED:   return "confirmed";
        case SettlementEventKind::FAILED:      return "failed";
    }
    return "failed";
}

// Everything the background thread needs once fetch_with_payment has returned.
struct PaymentEngine::Job {
    std::string request_id;
    std::string url;
    std::string context;
    std::string facilitator_url;
    std::string site_key;
    JNode       payload;
    JNode       requirements;
    PaymentInfo payment;
    std::string agent_id;
    AuthorizationContext auth;
    FileLock::Guard owner;  // "settle-<requestId>", held until the marker is gone
};

// Holds a context in the in-progress set until released or handed off.
class PaymentEngine::InProgressMark {
public:
    InProgressMark(PaymentEngine& e, std::string ctx) : e_(e), ctx_(std::move(ctx)) {}
    ~InProgressMark() { if (!handed_off_) e_.clear_in_progress(ctx_); }
    InProgressMark(const InProgressMark&) = delete;
    InProgressMark& operator=(const InProgressMark&) = delete;
    void hand_off() { handed_off_ = true; }
private:
    PaymentEngine& e_;
    std::string ctx_;
    bool handed_off_{false};
};

namespace {

bool is_success_status(int code) { return code >= 200 && code < 300; }

std::string content_type_of(const HttpResponse& r) {
    std::string ct = r.header("content-type");
    return ct.empty() ? "text/html" : ct;
}

FetchResult failure(const std::string& url, ErrorCode code, const std::string& message) {
    FetchResult r;
    r.ok = false;
    r.url = url;
    r.error = code;
    r.message = message;
    return r;
}

FetchResult declined(const std::string& url, const std::string& amount, const BudgetCheck& chk) {
    const std::string spent = chk.spent.empty() ? "?" : smallest_to_usdc(chk.spent);
    const std::string limit = chk.limit.empty() ? "?" : smallest_to_usdc(chk.limit);
    std::string msg;
    switch (chk.reason) {
        case BudgetReason::NO_BUDGET:
            msg = "No budget configured and no --max-price flag. Set a budget or use --max-price.";
            break;
        case BudgetReason::MAX_PRICE:
            msg = "Requested amount " + smallest_to_usdc(amount) + " USDC exceeds --max-price limit";
            break;
        case BudgetReason::DAILY:
            msg = "Daily budget exceeded: spent " + spent + " of " + limit + " daily limit";
            break;
        case BudgetReason::TOTAL:
            msg = "Total budget exceeded: spent " + spent + " of " + limit + " lifetime limit";
            break;
        case BudgetReason::PER_REQUEST:
            msg = "Requested amount " + smallest_to_usdc(amount) + " USDC exceeds per-request limit of " + limit;
            break;
        case BudgetReason::NONE:
            msg = "Budget check failed";
            break;
    }
    log_info(LogCategory::BUDGET, std::string("Budget check: DECLINED (") + budget_reason_to_string(chk.reason) + ")");

    ErrorCode code = ErrorCode::BUDGET_EXCEEDED;
    if (chk.reason == BudgetReason::MAX_PRICE) code = ErrorCode::MAX_PRICE_EXCEEDED;
    else if (chk.reason == BudgetReason::NO_BUDGET) code = ErrorCode::NO_BUDGET;

    FetchResult r = failure(url, code, msg);
    r.requested_amount = amount;
    r.budget_reason = chk.reason;
    return r;
}

bool is_decline(ErrorCode c) {
    return c == ErrorCode::NO_BUDGET || c == ErrorCode::MAX_PRICE_EXCEEDED || c == ErrorCode::BUDGET_EXCEEDED;
}

// First accepted payment the engine can sign for, honoring a requested network.
const AcceptedPayment& select_accept(const PaymentOffer& offer, const std::string& network) {
    if (offer.accepts.empty())
        throw EngineError(ErrorCode::INVALID_META_TAG, "Payment offer lists no accepted payments");
    for (const auto& a : offer.accepts) {
        if (a.scheme != "exact") continue;
        if (!network.empty() && a.network != network) continue;
        uint64_t chain_id = 0;
        if (!parse_chain_id(a.network, chain_id)) continue;
        return a;
    }
    const AcceptedPayment& first = offer.accepts.front();
    if (!network.empty() && first.network != network)
        throw EngineError(ErrorCode::UNSUPPORTED_NETWORK,
                          "Offer network " + first.network + " does not match requested network " + network);
    throw EngineError(ErrorCode::UNSUPPORTED_NETWORK, "Unsupported network: " + first.network);
}

void require_amount(const AcceptedPayment& a) {
    Amount parsed;
    if (!Amount::parse(a.amount, parsed))
        throw EngineError(ErrorCode::INVALID_META_TAG, "Invalid payment amount: " + a.amount);
}

PaymentInfo payment_info(PaymentMode mode, const AcceptedPayment& a, const std::string& payer) {
    PaymentInfo p;
    p.mode = mode;
    p.amount = a.amount;
    p.amount_formatted = smallest_to_usdc(a.amount);
    p.asset = a.asset;
    p.network = a.network;
    p.pay_to = a.pay_to;
    p.payer = payer;
    return p;
}

LedgerEntry ledger_entry(const std::string& url, const PaymentInfo& p, EntryStatus status) {
    LedgerEntry e;
    e.ts = iso8601_utc(now_ms());
    e.url = url;
    e.amount = p.amount;
    e.asset = p.asset;
    e.network = p.network;
    e.tx_hash = p.tx_hash;
    e.mode = payment_mode_to_string(p.mode);
    e.request_id = p.request_id;
    e.status = status;
    if (status == EntryStatus::CONFIRMED) e.settled_at = e.ts;
    return e;
}

SettlementContext settlement_context(const PaymentInfo& p) {
    SettlementContext s;
    s.tx_hash = p.tx_hash;
    s.network = p.network;
    s.amount = p.amount;
    s.amount_formatted = p.amount_formatted;
    s.currency = p.asset;
    s.payer = p.payer;
    s.payee = p.pay_to;
    return s;
}

std::string string_field(const JNode& obj, const char* key) {
    std::string v;
    json_get_string(obj, key, v);
    return v;
}

std::string settle_lock_name(const std::string& request_id) {
    return "settle-" + request_id;
}

// Request ids are UUIDs; anything else never names a lock file.
bool lockable_request_id(const std::string& id) {
    if (id.empty()) return false;
    for (char c : id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') return false;
    }
    return true;
}

}

PaymentEngine::PaymentEngine(BlobStore& store, HttpTransport& http, Wallet& wallet, EngineSettings settings)
    : store_(store),
      http_(http),
      wallet_(wallet),
      settings_(std::move(settings)),
      lock_(store.root()),
      ledger_(store),
      budgets_(store),
      receipts_(store),
      pending_(store),
      facilitator_(http) {}

PaymentEngine::~PaymentEngine() {
    wait_idle();
}

void PaymentEngine::set_listener(SettlementListener listener) {
    std::lock_guard<std::mutex> lk(mu_);
    listener_ = std::move(listener);
}

void PaymentEngine::notify(const SettlementEvent& ev) {
    SettlementListener l;
    {
        std::lock_guard<std::mutex> lk(mu_);
        l = listener_;
    }
    if (!l) return;
    try {
        l(ev);
    } catch (const std::exception& e) {
        log_warn(LogCategory::ENGINE, std::string("settlement listener threw: ") + e.what());
    }
}

bool PaymentEngine::mark_in_progress(const std::string& context) {
    std::lock_guard<std::mutex> lk(mu_);
    return in_progress_.insert(context).second;
}

void PaymentEngine::clear_in_progress(const std::string& context) {
    std::lock_guard<std::mutex> lk(mu_);
    in_progress_.erase(context);
}

bool PaymentEngine::in_progress(const std::string& context) const {
    std::lock_guard<std::mutex> lk(mu_);
    return in_progress_.count(context) != 0;
}

void PaymentEngine::wait_idle() {
    for (;;) {
        std::map<uint64_t, std::thread> batch;
        {
            std::lock_guard<std::mutex> lk(mu_);
            batch.swap(workers_);
            finished_.clear();
        }
        if (batch.empty()) return;
        for (auto& w : batch)
            if (w.second.joinable()) w.second.join();
    }
}

size_t PaymentEngine::active_workers() {
    std::lock_guard<std::mutex> lk(mu_);
    reap_finished_locked();
    return workers_.size();
}

// A finished worker has nothing left to run after finish_worker(), so the join is brief.
void PaymentEngine::reap_finished_locked() {
    for (uint64_t seq : finished_) {
        auto it = workers_.find(seq);
        if (it == workers_.end()) continue;
        if (it->second.joinable()) it->second.join();
        workers_.erase(it);
    }
    finished_.clear();
}

void PaymentEngine::finish_worker(uint64_t seq) {
    std::lock_guard<std::mutex> lk(mu_);
    finished_.push_back(seq);
}

bool PaymentEngine::owner_alive(const std::string& request_id) const {
    if (!lockable_request_id(request_id)) return false;
    return lock_.is_locked(settle_lock_name(request_id));
}

std::shared_ptr<const ResolvedKey> PaymentEngine::signing_key() {
    return keys_.get_or_resolve([this] { return wallet_.resolve(); });
}

AuthorizationContext PaymentEngine::snapshot_authorization(const std::string& max_price) const {
    AuthorizationContext a;
    BudgetConfig cfg;
    const bool have_budget = budgets_.get(cfg);
    a.per_request_limit = !max_price.empty() ? max_price : (have_budget ? cfg.per_request_max : std::string());
    if (have_budget) {
        a.daily_limit = cfg.daily_max;
        a.total_limit = cfg.total_max;
    }
    try {
        SpendingTotals t = ledger_.totals();
        a.daily_spent = smallest_to_usdc(t.today);
        a.total_spent = smallest_to_usdc(t.lifetime);
    } catch (const EngineError& e) {
        log_warn(LogCategory::ENGINE, std::string("spend totals unavailable for receipt: ") + e.what());
    }
    a.authorized_at = iso8601_utc(now_ms());
    return a;
}

void PaymentEngine::record_receipt(FetchResult& r, const std::string& agent_id, AuthorizationContext auth) {
    if (!settings_.record_receipts) return;
    Receipt rc;
    if (r.ok && r.has_payment) {
        if (r.payment.pending) return;  // written when the background settlement completes
        auth.requested_amount = r.payment.amount_formatted;
        rc = make_settled_receipt(r.url, agent_id, auth, settlement_context(r.payment));
    } else if (!r.ok && is_decline(r.error)) {
        auth.requested_amount = r.requested_amount.empty() ? "0.00" : smallest_to_usdc(r.requested_amount);
        DeclineContext d;
        d.reason = error_code_to_string(r.error);
        d.limit = budget_reason_to_string(r.budget_reason);
        d.requested_amount = auth.requested_amount;
        if (r.budget_reason == BudgetReason::MAX_PRICE) d.limit_value = auth.per_request_limit;
        else if (r.budget_reason == BudgetReason::PER_REQUEST) d.limit_value = auth.per_request_limit;
        else if (r.budget_reason == BudgetReason::DAILY) d.limit_value = auth.daily_limit;
        else if (r.budget_reason == BudgetReason::TOTAL) d.limit_value = auth.total_limit;
        if (d.limit_value.empty()) d.limit_value = "0.00";
        rc = make_declined_receipt(r.url, agent_id, auth, d);
    } else {
        rc = make_intent_receipt(r.url, agent_id, auth);
    }
    if (receipts_.append(rc)) r.receipt_id = rc.id;
}

FetchResult PaymentEngine::fetch_with_payment(const std::string& url, const FetchOptions& opts) {
    const std::string agent_id = !opts.agent_id.empty() ? opts.agent_id : settings_.agent_id;
    AuthorizationContext auth;
    FetchResult r;
    try {
        auth = snapshot_authorization(opts.max_price);
        r = run(url, opts);
    } catch (const EngineError& e) {
        log_warn(LogCategory::ENGINE, std::string("fetch ") + url + " failed: " + e.what());
        r = failure(url, e.code(), e.detail().empty() ? e.what() : e.detail());
    } catch (const std::exception& e) {
        log_error(LogCategory::ENGINE, std::string("fetch ") + url + " failed: " + e.what());
        r = failure(url, ErrorCode::PAYMENT_ERROR, e.what());
    }
    record_receipt(r, agent_id, auth);
    return r;
}

FetchResult PaymentEngine::run(const std::string& url, const FetchOptions& opts) {
    Url parsed;
    std::string err;
    if (!parse_url(url, parsed, err))
        throw EngineError(ErrorCode::INVALID_URL, "Invalid URL: " + url);

    HttpRequest req;
    req.url = url;
    req.timeout_ms = opts.timeout_ms > 0 ? opts.timeout_ms : 30000;
    HttpResponse page;
    TOLLGATE_LOG_DEBUG(LogCategory::ENGINE, "fetching " + url);
    if (!http_.send(req, page, err)) {
        if (is_timeout_error(err))
            throw EngineError(ErrorCode::TIMEOUT, "Failed to fetch: " + err);
        throw EngineError(ErrorCode::NETWORK_ERROR, "Failed to fetch: " + err);
    }

    Signal sig = detect(page.code, page.headers, page.body);
    if (sig.kind == SignalKind::PROTOCOL_402)
        return handle_402(url, opts, sig.offer);
    if (sig.kind == SignalKind::INLINE)
        return handle_inline(url, opts, page, sig.offer);

    FetchResult r;
    r.ok = true;
    r.url = url;
    r.status_code = page.code;
    r.content_type = content_type_of(page);
    r.content = page.body;
    return r;
}

FetchResult PaymentEngine::handle_inline(const std::string& url, const FetchOptions& opts,
                                         const HttpResponse& page, const PaymentOffer& offer) {
    const AcceptedPayment& accept = select_accept(offer, opts.network);
    require_amount(accept);

    if (offer.mode == PaymentMode::SERVER && offer.payment_url.empty())
        throw EngineError(ErrorCode::MISSING_PAYMENT_URL, "Server-mode offer has no paymentUrl");

    const std::string expected = expected_asset(accept.network);
    if (!expected.empty() && to_lower(expected) != to_lower(accept.asset))
        throw EngineError(ErrorCode::ASSET_MISMATCH,
                          "Asset " + accept.asset + " does not match expected " + expected +
                          " for network " + accept.network);

    const std::string context = opts.context.empty() ? url : opts.context;
    if (!mark_in_progress(context))
        throw EngineError(ErrorCode::PAYMENT_IN_PROGRESS, "Payment already in progress for " + context);
    InProgressMark mark(*this, context);

    FileLock::Guard budget_lock = lock_.acquire("budget", settings_.lock_timeout_ms);
    BudgetCheck chk = check_budget(budgets_, ledger_, accept.amount, opts.max_price);
    if (!chk.allowed) return declined(url, accept.amount, chk);
    log_info(LogCategory::BUDGET, "Budget check: APPROVED " + smallest_to_usdc(accept.amount) + " USDC");

    DomainInfo dom = facilitator_.get_supported(offer.facilitator_url, offer.site_key, accept.network);
    Eip712Domain domain;
    domain.name = dom.name;
    domain.version = dom.version;
    parse_chain_id(accept.network, domain.chain_id);
    domain.verifying_contract = dom.verifying_contract.empty() ? accept.asset : dom.verifying_contract;

    std::shared_ptr<const ResolvedKey> key = signing_key();
    SignedAuthorization signed_auth = sign_authorization(key->priv, domain, accept);
    JNode requirements = requirements_json(accept, dom.extra);
    JNode payload = payment_payload_json(url, requirements, signed_auth);

    PaymentInfo info = payment_info(offer.mode, accept, key->address);
    FetchResult r;
    r.url = url;
    r.status_code = page.code;
    r.content_type = content_type_of(page);
    r.content = page.body;

    if (offer.mode == PaymentMode::SERVER) {
        PublisherPaymentResult pub = submit_payment(http_, offer.payment_url, payload, opts.timeout_ms);
        info.tx_hash = pub.tx_hash;
        ledger_.append(ledger_entry(url, info, EntryStatus::CONFIRMED));
        budget_lock.release();
        r.ok = true;
        r.status_code = 200;
        r.content = pub.content;
        if (!pub.content_type.empty()) r.content_type = pub.content_type;
        r.has_payment = true;
        r.payment = info;
        return r;
    }

    if (opts.optimistic && offer.optimistic) {
        info.request_id = random_uuid();
        info.pending = true;

        Job job;
        job.request_id = info.request_id;
        job.url = url;
        job.context = context;
        job.facilitator_url = offer.facilitator_url;
        job.site_key = offer.site_key;
        job.payload = payload;
        job.requirements = requirements;
        job.payment = info;
        job.agent_id = !opts.agent_id.empty() ? opts.agent_id : settings_.agent_id;
        job.auth = snapshot_authorization(opts.max_price);
        job.auth.requested_amount = info.amount_formatted;
        job.owner = lock_.acquire(settle_lock_name(info.request_id), settings_.lock_timeout_ms);

        ledger_.append(ledger_entry(url, info, EntryStatus::PENDING));

        PendingSettlement marker;
        marker.request_id = info.request_id;
        marker.context = context;
        marker.url = url;
        marker.facilitator_url = offer.facilitator_url;
        marker.site_key = offer.site_key;
        marker.payload = payload;
        marker.requirements = requirements;
        marker.signed_at_ms = now_ms();
        try {
            pending_.add(marker);
        } catch (const EngineError& e) {
            const std::string error = e.detail().empty() ? e.what() : e.detail();
            ledger_.update_status(info.request_id, EntryStatus::FAILED, "", error);
            lock_.discard(settle_lock_name(info.request_id));
            SettlementEvent failed;
            failed.kind = SettlementEventKind::FAILED;
            failed.request_id = info.request_id;
            failed.url = url;
            failed.context = context;
            failed.payment = info;
            failed.payment.pending = false;
            failed.error = error;
            budget_lock.release();
            notify(failed);
            throw;
        }
        budget_lock.release();

        SettlementEvent ev;
        ev.kind = SettlementEventKind::PROVISIONAL;
        ev.request_id = info.request_id;
        ev.url = url;
        ev.context = context;
        ev.payment = info;
        notify(ev);

        mark.hand_off();
        settle_in_background(std::move(job));
        log_info(LogCategory::ENGINE, "optimistic payment " + info.request_id + " for " + url + " settling in background");

        r.ok = true;
        r.has_payment = true;
        r.payment = info;
        return r;
    }

    if (!settings_.skip_verify) {
        VerifyResult v = facilitator_.verify(offer.facilitator_url, offer.site_key, payload, requirements);
        if (!v.is_valid)
            throw EngineError(ErrorCode::VERIFY_FAILED,
                              "Payment verification failed: " +
                              (v.invalid_reason.empty() ? std::string("unknown reason") : v.invalid_reason));
    }
    SettleResult s = facilitator_.settle(offer.facilitator_url, offer.site_key, payload, requirements);
    info.tx_hash = s.tx_hash;
    if (!s.payer.empty()) info.payer = s.payer;
    ledger_.append(ledger_entry(url, info, EntryStatus::CONFIRMED));
    budget_lock.release();

    r.ok = true;
    r.has_payment = true;
    r.payment = info;
    return r;
}

void PaymentEngine::settle_in_background(Job job) {
    std::lock_guard<std::mutex> lk(mu_);
    reap_finished_locked();
    const uint64_t seq = next_worker_++;
    workers_.emplace(seq, std::thread([this, seq, job = std::move(job)]() mutable {
        complete_job(job);
        finish_worker(seq);
    }));
}

void PaymentEngine::complete_job(Job& job) {
    SettlementEvent ev;
    ev.request_id = job.request_id;
    ev.url = job.url;
    ev.context = job.context;
    ev.payment = job.payment;
    ev.payment.pending = false;

    try {
        if (!settings_.skip_verify) {
            VerifyResult v = facilitator_.verify(job.facilitator_url, job.site_key, job.payload, job.requirements);
            if (!v.is_valid)
                throw EngineError(ErrorCode::VERIFY_FAILED,
                                  "Payment verification failed: " +
                                  (v.invalid_reason.empty() ? std::string("unknown reason") : v.invalid_reason));
        }
        SettleResult s = facilitator_.settle(job.facilitator_url, job.site_key, job.payload, job.requirements);
        ev.kind = SettlementEventKind::CONFIRMED;
        ev.payment.tx_hash = s.tx_hash;
        if (!s.payer.empty()) ev.payment.payer = s.payer;
    } catch (const EngineError& e) {
        ev.kind = SettlementEventKind::FAILED;
        ev.error = e.detail().empty() ? e.what() : e.detail();
    } catch (const std::exception& e) {
        ev.kind = SettlementEventKind::FAILED;
        ev.error = e.what();
    }

    bool updated = false;
    bool recorded = true;
    try {
        updated = ev.kind == SettlementEventKind::CONFIRMED
            ? ledger_.update_status(job.request_id, EntryStatus::CONFIRMED, ev.payment.tx_hash, "")
            : ledger_.update_status(job.request_id, EntryStatus::FAILED, "", ev.error);
    } catch (const EngineError& e) {
        recorded = false;
        log_error(LogCategory::ENGINE, "ledger update for " + job.request_id + " failed: " + e.what());
    }

    if (updated) {
        if (ev.kind == SettlementEventKind::CONFIRMED) {
            log_info(LogCategory::ENGINE, "settlement " + job.request_id + " confirmed: " + ev.payment.tx_hash);
            if (settings_.record_receipts)
                receipts_.append(make_settled_receipt(job.url, job.agent_id, job.auth,
                                                      settlement_context(ev.payment)));
        } else {
            log_warn(LogCategory::ENGINE, "settlement " + job.request_id + " failed: " + ev.error);
        }
        notify(ev);
    } else {
        log_warn(LogCategory::ENGINE, "settlement " + job.request_id + " already resolved, ignoring completion");
    }

    // Without a ledger update the marker stays for the next recovery sweep
    if (recorded) {
        try {
            pending_.remove(job.request_id);
        } catch (const EngineError& e) {
            log_error(LogCategory::ENGINE, "could not clear pending marker " + job.request_id + ": " + e.what());
        }
    }
    lock_.discard(settle_lock_name(job.request_id));
    job.owner.release();
    clear_in_progress(job.context);
}

size_t PaymentEngine::recover_pending() {
    const int64_t t = now_ms();
    std::vector<SettlementEvent> events;
    pending_.reclaim(
        [this](const PendingSettlement& m) {
            if (!owner_alive(m.request_id)) return false;
            TOLLGATE_LOG_DEBUG(LogCategory::ENGINE, "settlement " + m.request_id + " still running elsewhere");
            return true;
        },
        [&](const PendingSettlement& m) {
            const std::string error = (t - m.signed_at_ms > RECOVERY_TIMEOUT_MS)
                ? "Settlement timeout (process restarted)"
                : "Settlement interrupted (process restarted)";
            if (!ledger_.update_status(m.request_id, EntryStatus::FAILED, "", error)) return;
            log_warn(LogCategory::ENGINE, "recovered " + m.request_id + ": " + error);

            SettlementEvent ev;
            ev.kind = SettlementEventKind::FAILED;
            ev.request_id = m.request_id;
            ev.url = m.url;
            ev.context = m.context;
            ev.error = error;
            LedgerEntry entry;
            if (ledger_.find(m.request_id, entry)) {
                ev.payment.amount = entry.amount;
                ev.payment.amount_formatted = smallest_to_usdc(entry.amount);
                ev.payment.asset = entry.asset;
                ev.payment.network = entry.network;
            }
            events.push_back(std::move(ev));
        });

    for (const auto& ev : events) notify(ev);
    return events.size();
}

FetchResult PaymentEngine::handle_402(const std::string& url, const FetchOptions& opts, const PaymentOffer& offer) {
    const AcceptedPayment& accept = select_accept(offer, opts.network);
    require_amount(accept);

    std::string dname, dversion;
    json_get_string(accept.extra, "name", dname);
    json_get_string(accept.extra, "version", dversion);
    if (dname.empty() || dversion.empty())
        throw EngineError(ErrorCode::PAYMENT_ERROR,
                          "402 requirements for " + accept.network + " carry no EIP-712 domain name/version");

    const std::string context = opts.context.empty() ? url : opts.context;
    if (!mark_in_progress(context))
        throw EngineError(ErrorCode::PAYMENT_IN_PROGRESS, "Payment already in progress for " + context);
    InProgressMark mark(*this, context);

    FileLock::Guard budget_lock = lock_.acquire("budget", settings_.lock_timeout_ms);
    BudgetCheck chk = check_budget(budgets_, ledger_, accept.amount, opts.max_price);
    if (!chk.allowed) return declined(url, accept.amount, chk);
    log_info(LogCategory::BUDGET, "Budget check: APPROVED " + smallest_to_usdc(accept.amount) + " USDC (402)");

    Eip712Domain domain;
    domain.name = dname;
    domain.version = dversion;
    parse_chain_id(accept.network, domain.chain_id);
    domain.verifying_contract = accept.asset;

    std::shared_ptr<const ResolvedKey> key = signing_key();
    SignedAuthorization signed_auth = sign_authorization(key->priv, domain, accept);

    HttpRequest retry;
    retry.url = url;
    retry.timeout_ms = opts.timeout_ms > 0 ? opts.timeout_ms : 30000;
    if (offer.x402_version >= 2) {
        JNode payload = payment_payload_json(url, requirements_json(accept, accept.extra), signed_auth);
        if (json_is_object(offer.resource))
            std::get<JObject>(payload.v)["resource"] = offer.resource;
        retry.headers.emplace_back("PAYMENT-SIGNATURE", base64_encode(json_dump(payload)));
    } else {
        JNode payload = payment_payload_v1_json(accept, signed_auth);
        retry.headers.emplace_back("X-PAYMENT", base64_encode(json_dump(payload)));
    }

    HttpResponse resp;
    std::string err;
    if (!http_.send(retry, resp, err)) {
        if (is_timeout_error(err))
            throw EngineError(ErrorCode::TIMEOUT, "402 payment retry failed: " + err);
        throw EngineError(ErrorCode::NETWORK_ERROR, "402 payment retry failed: " + err);
    }
    if (!is_success_status(resp.code))
        throw EngineError(ErrorCode::PAYMENT_ERROR, "402 payment flow failed: HTTP " + std::to_string(resp.code));

    PaymentInfo info = payment_info(PaymentMode::PROTOCOL_402, accept, key->address);
    std::string settlement = resp.header("payment-response");
    if (settlement.empty()) settlement = resp.header("x-payment-response");
    if (!settlement.empty()) {
        std::string decoded;
        JNode j;
        if (base64_decode(settlement, decoded) && json_parse(decoded, j) && json_is_object(j)) {
            info.tx_hash = string_field(j, "transaction");
            const std::string payer = string_field(j, "payer");
            if (!payer.empty()) info.payer = payer;
            const std::string net = string_field(j, "network");
            if (!net.empty()) info.network = net;
        } else {
            log_warn(LogCategory::ENGINE, "unreadable payment response header from " + url);
        }
    }
    if (info.tx_hash.empty()) info.tx_hash = UNKNOWN_TX_HASH;

    ledger_.append(ledger_entry(url, info, EntryStatus::CONFIRMED));
    budget_lock.release();

    FetchResult r;
    r.ok = true;
    r.url = url;
    r.status_code = resp.code;
    r.content_type = content_type_of(resp);
    r.content = resp.body;
    r.has_payment = true;
    r.payment = info;
    return r;
}

}
