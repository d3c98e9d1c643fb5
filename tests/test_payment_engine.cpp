#include "test_support.h"

#include "base64.h"
#include "blob_store.h"
#include "budget.h"
#include "errors.h"
#include "file_lock.h"
#include "history.h"
#include "payment_engine.h"
#include "pending_settlements.h"
#include "receipts.h"
#include "util.h"
#include "wallet/wallet_file.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace tollgate;
using testing_support::FakeTransport;
using testing_support::TempDir;
using testing_support::request_header;

static const char* PAGE = "https://news.example/article";
static const char* FACILITATOR = "https://facilitator.example";
static const char* USDC = "0x2e08028E3C4c2356572E096d8EF835cD5C6030bD";
static const char* PAY_TO = "0x7E5F4552091A69125d5DFCb7b8C2659029395Bdf";
static const char* PAYER = "0x2c7536E3605D9C16a7a3D7b1898e529396a65c23";

static std::string meta_page(const std::string& mode, const std::string& asset = USDC,
                             const std::string& tail = "") {
    const std::string json = std::string("{\"x402Version\":2,\"mode\":\"") + mode +
        "\",\"facilitatorUrl\":\"" + FACILITATOR + "\"" + tail +
        ",\"accepts\":[{\"scheme\":\"exact\",\"network\":\"eip155:324705682\",\"amount\":\"10000\","
        "\"asset\":\"" + asset + "\",\"payTo\":\"" + PAY_TO + "\"}]}";
    return "<html><head><meta name=\"x402-payment-required\" content=\"" + base64_encode(json) +
           "\"></head><body>teaser</body></html>";
}

static void facilitator_routes(FakeTransport& http) {
    http.reply("GET", std::string(FACILITATOR) + "/supported", 200,
               "{\"kinds\":[{\"scheme\":\"exact\",\"network\":\"eip155:324705682\","
               "\"extra\":{\"name\":\"USDC\",\"version\":\"2\"}}]}");
    http.reply("POST", std::string(FACILITATOR) + "/verify", 200, "{\"isValid\":true}");
    http.reply("POST", std::string(FACILITATOR) + "/settle", 200,
               "{\"success\":true,\"transaction\":\"0xsettled\",\"network\":\"eip155:324705682\"}");
}

// One-shot gate a fake handler can park on until the test releases it.
struct Gate {
    std::mutex mu;
    std::condition_variable cv;
    bool entered{false};
    bool open{false};

    void wait_inside() {
        std::unique_lock<std::mutex> lk(mu);
        entered = true;
        cv.notify_all();
        cv.wait(lk, [this] { return open; });
    }
    void wait_entered() {
        std::unique_lock<std::mutex> lk(mu);
        cv.wait(lk, [this] { return entered; });
    }
    void release() {
        std::lock_guard<std::mutex> lk(mu);
        open = true;
        cv.notify_all();
    }
};

struct Events {
    std::mutex mu;
    std::vector<SettlementEvent> seen;

    SettlementListener listener() {
        return [this](const SettlementEvent& ev) {
            std::lock_guard<std::mutex> lk(mu);
            seen.push_back(ev);
        };
    }
    size_t count(SettlementEventKind k) {
        std::lock_guard<std::mutex> lk(mu);
        size_t n = 0;
        for (const auto& e : seen) if (e.kind == k) ++n;
        return n;
    }
};

struct Fixture {
    TempDir dir;
    FileBlobStore store{dir.path()};
    FakeTransport http;
    Wallet wallet{store};

    bool open() {
        std::string err;
        return store.open(err);
    }
    void budget(const std::string& per_request, const std::string& daily) {
        BudgetStore b(store);
        BudgetConfig c;
        c.per_request_max = per_request;
        c.daily_max = daily;
        b.set(c);
    }
};

static bool wait_until(const std::function<bool()>& done, int timeout_ms = 5000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!done()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

// Pending entry and marker as a process that died mid-settlement leaves them.
static void add_orphan(PaymentEngine& engine, const std::string& request_id, int64_t age_ms) {
    LedgerEntry entry;
    entry.ts = iso8601_utc(now_ms() - age_ms);
    entry.url = PAGE;
    entry.amount = "10000";
    entry.asset = USDC;
    entry.network = "eip155:324705682";
    entry.mode = "client";
    entry.request_id = request_id;
    entry.status = EntryStatus::PENDING;
    engine.ledger().append(entry);

    PendingSettlement marker;
    marker.request_id = request_id;
    marker.context = PAGE;
    marker.url = PAGE;
    marker.facilitator_url = FACILITATOR;
    marker.payload = jobj();
    marker.requirements = jobj();
    marker.signed_at_ms = now_ms() - age_ms;
    engine.pending().add(marker);
}

int main(){
    ::setenv(PRIVATE_KEY_ENV, "0x4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318", 1);

    // No signal: content passes through with an intent receipt
    {
        Fixture f;
        TEST_CHECK(f.open(), "open store");
        f.http.reply("GET", PAGE, 200, "<html>free</html>", {{"content-type", "text/html; charset=utf-8"}});
        PaymentEngine engine(f.store, f.http, f.wallet);
        FetchResult r = engine.fetch_with_payment(PAGE);
        TEST_CHECK(r.ok && !r.has_payment && r.content == "<html>free</html>", "free page");
        TEST_CHECK(r.content_type == "text/html; charset=utf-8", "content type");
        Receipt rc;
        TEST_CHECK(engine.receipts().get(r.receipt_id, rc) && rc.stage == Ap2Stage::INTENT, "intent receipt");
        TEST_CHECK(engine.ledger().entries().empty(), "nothing spent");
    }

    // Transport failures
    {
        Fixture f;
        TEST_CHECK(f.open(), "open store");
        PaymentEngine engine(f.store, f.http, f.wallet);
        FetchResult r = engine.fetch_with_payment(PAGE);
        TEST_CHECK(!r.ok && r.error == ErrorCode::NETWORK_ERROR, "unreachable page");

        f.http.on("GET", PAGE, [](const HttpRequest& req, HttpResponse&, std::string& err) {
            err = "timeout after " + std::to_string(req.timeout_ms) + " ms";
            return false;
        });
        FetchOptions fo;
        fo.timeout_ms = 1500;
        r = engine.fetch_with_payment(PAGE, fo);
        TEST_CHECK(!r.ok && r.error == ErrorCode::TIMEOUT, "timeout");
        TEST_CHECK(r.message == "Failed to fetch: timeout after 1500 ms", "timeout carried to the request");

        r = engine.fetch_with_payment("gopher://news.example/");
        TEST_CHECK(!r.ok && r.error == ErrorCode::INVALID_URL, "bad url");
    }

    // Budget gate declines before anything is signed
    {
        Fixture f;
        TEST_CHECK(f.open(), "open store");
        f.http.reply("GET", PAGE, 200, meta_page("client"));
        facilitator_routes(f.http);
        PaymentEngine engine(f.store, f.http, f.wallet);

        FetchResult r = engine.fetch_with_payment(PAGE);
        TEST_CHECK(!r.ok && r.error == ErrorCode::NO_BUDGET, "no budget, no max price");
        TEST_CHECK(r.message == "No budget configured and no --max-price flag. Set a budget or use --max-price.",
                   "no budget message");
        TEST_CHECK(exit_code_for(r.error) == 2, "policy exit code");
        Receipt rc;
        TEST_CHECK(engine.receipts().get(r.receipt_id, rc) && rc.stage == Ap2Stage::DECLINED &&
                   rc.decline.limit == "no_budget", "declined receipt names the limit");

        FetchOptions fo;
        fo.max_price = "0.005";
        r = engine.fetch_with_payment(PAGE, fo);
        TEST_CHECK(!r.ok && r.error == ErrorCode::MAX_PRICE_EXCEEDED && r.budget_reason == BudgetReason::MAX_PRICE,
                   "max price");
        TEST_CHECK(r.message == "Requested amount 0.01 USDC exceeds --max-price limit", "max price message");
        TEST_CHECK(r.requested_amount == "10000", "requested amount");

        f.budget("0.005", "");
        r = engine.fetch_with_payment(PAGE);
        TEST_CHECK(!r.ok && r.error == ErrorCode::BUDGET_EXCEEDED && r.budget_reason == BudgetReason::PER_REQUEST,
                   "per-request limit");
        TEST_CHECK(r.message == "Requested amount 0.01 USDC exceeds per-request limit of 0.005", "per-request message");
        TEST_CHECK(f.http.count("GET", std::string(FACILITATOR) + "/supported") == 0, "facilitator never contacted");
    }

    // Client mode, synchronous settlement
    {
        Fixture f;
        TEST_CHECK(f.open(), "open store");
        f.budget("0.05", "1");
        f.http.reply("GET", PAGE, 200, meta_page("client"));
        facilitator_routes(f.http);
        PaymentEngine engine(f.store, f.http, f.wallet, EngineSettings());

        FetchResult r = engine.fetch_with_payment(PAGE);
        TEST_CHECK(r.ok && r.has_payment, "paid");
        TEST_CHECK(r.payment.mode == PaymentMode::CLIENT && r.payment.tx_hash == "0xsettled", "client tx");
        TEST_CHECK(r.payment.amount == "10000" && r.payment.amount_formatted == "0.01", "amount");
        TEST_CHECK(r.payment.payer == PAYER && r.payment.pay_to == PAY_TO, "payer and payee");
        TEST_CHECK(f.http.count("POST", std::string(FACILITATOR) + "/verify") == 1, "verified first");
        TEST_CHECK(f.http.count("POST", std::string(FACILITATOR) + "/settle") == 1, "settled once");

        std::vector<LedgerEntry> entries = engine.ledger().entries();
        TEST_CHECK(entries.size() == 1 && entries[0].status == EntryStatus::CONFIRMED &&
                   entries[0].tx_hash == "0xsettled" && entries[0].mode == "client", "one confirmed entry");
        Receipt rc;
        TEST_CHECK(engine.receipts().get(r.receipt_id, rc) && rc.stage == Ap2Stage::SETTLED && rc.has_verification,
                   "settled receipt");

        // The signed payload sent to /settle recovers to our address
        JNode body;
        std::string signer_seen;
        for (const auto& q : f.http.requests()) {
            if (q.url != std::string(FACILITATOR) + "/settle") continue;
            TEST_CHECK(json_parse(q.body, body), "settle body json");
            const JNode* pp = json_get(body, "paymentPayload");
            const JNode* inner = pp ? json_get(*pp, "payload") : nullptr;
            const JNode* auth = inner ? json_get(*inner, "authorization") : nullptr;
            if (auth) signer_seen = json_string_or(*auth, "from");
        }
        TEST_CHECK(signer_seen == PAYER, "authorization from our wallet");

        // verify isValid=false stops before settlement
        f.http.reply("POST", std::string(FACILITATOR) + "/verify", 200,
                     "{\"isValid\":false,\"invalidReason\":\"insufficient_funds\"}");
        r = engine.fetch_with_payment(PAGE);
        TEST_CHECK(!r.ok && r.error == ErrorCode::VERIFY_FAILED, "verify failure");
        TEST_CHECK(f.http.count("POST", std::string(FACILITATOR) + "/settle") == 1, "no settle after failed verify");

        f.http.reply("POST", std::string(FACILITATOR) + "/verify", 200, "{\"isValid\":true}");
        f.http.reply("POST", std::string(FACILITATOR) + "/settle", 200, "{\"success\":false,\"errorReason\":\"nonce_used\"}");
        r = engine.fetch_with_payment(PAGE);
        TEST_CHECK(!r.ok && r.error == ErrorCode::SETTLE_FAILED && r.message == "Settlement failed: nonce_used",
                   "settle failure");
        TEST_CHECK(engine.ledger().entries().size() == 1, "failed attempts add no ledger entries");
        TEST_CHECK(!engine.in_progress(PAGE), "in-progress mark cleared after failure");
    }

    // Offer checks
    {
        Fixture f;
        TEST_CHECK(f.open(), "open store");
        f.budget("1", "");
        facilitator_routes(f.http);
        PaymentEngine engine(f.store, f.http, f.wallet);

        f.http.reply("GET", PAGE, 200, meta_page("client", "0x1111111111111111111111111111111111111111"));
        FetchResult r = engine.fetch_with_payment(PAGE);
        TEST_CHECK(!r.ok && r.error == ErrorCode::ASSET_MISMATCH, "asset must be the network's USDC");

        f.http.reply("GET", PAGE, 200, meta_page("server"));
        r = engine.fetch_with_payment(PAGE);
        TEST_CHECK(!r.ok && r.error == ErrorCode::MISSING_PAYMENT_URL, "server mode needs paymentUrl");

        f.http.reply("GET", PAGE, 200, meta_page("client"));
        FetchOptions fo;
        fo.network = "eip155:1187947933";
        r = engine.fetch_with_payment(PAGE, fo);
        TEST_CHECK(!r.ok && r.error == ErrorCode::UNSUPPORTED_NETWORK, "requested network must match");
    }

    // Server mode: content comes from the publisher's payment endpoint
    {
        Fixture f;
        TEST_CHECK(f.open(), "open store");
        f.budget("0.05", "");
        facilitator_routes(f.http);
        f.http.reply("GET", PAGE, 200, meta_page("server", USDC, ",\"paymentUrl\":\"https://news.example/api/pay\""));
        f.http.reply("POST", "https://news.example/api/pay", 200,
                     "{\"success\":true,\"txHash\":\"0xpub\",\"content\":\"<article>full text</article>\","
                     "\"contentType\":\"text/html\"}");
        PaymentEngine engine(f.store, f.http, f.wallet);

        FetchResult r = engine.fetch_with_payment(PAGE);
        TEST_CHECK(r.ok && r.content == "<article>full text</article>", "publisher content returned");
        TEST_CHECK(r.payment.mode == PaymentMode::SERVER && r.payment.tx_hash == "0xpub", "server payment");
        TEST_CHECK(f.http.count("POST", std::string(FACILITATOR) + "/settle") == 0, "publisher settles, not us");
        std::vector<LedgerEntry> entries = engine.ledger().entries();
        TEST_CHECK(entries.size() == 1 && entries[0].mode == "server" && entries[0].tx_hash == "0xpub", "ledger");
    }

    // HTTP 402 takes precedence over inline markup
    {
        Fixture f;
        TEST_CHECK(f.open(), "open store");
        f.budget("0.05", "");
        facilitator_routes(f.http);
        const std::string required = std::string("{\"x402Version\":2,\"resource\":{\"url\":\"") + PAGE + "\"}," +
            "\"accepts\":[{\"scheme\":\"exact\",\"network\":\"eip155:324705682\",\"amount\":\"20000\"," +
            "\"asset\":\"" + USDC + "\",\"payTo\":\"" + PAY_TO + "\",\"extra\":{\"name\":\"USDC\",\"version\":\"2\"}}]}";
        const std::string settled = base64_encode(std::string(
            "{\"success\":true,\"transaction\":\"0x402tx\",\"network\":\"eip155:324705682\"}"));
        const std::string inline_page = meta_page("client");
        std::atomic<int> paid_retries{0};
        f.http.on("GET", PAGE, [&](const HttpRequest& req, HttpResponse& out, std::string&) {
            const std::string sig = request_header(req, "PAYMENT-SIGNATURE");
            if (sig.empty()) {
                out.code = 402;
                out.headers["payment-required"] = base64_encode(required);
                out.body = inline_page;
                return true;
            }
            std::string decoded;
            JNode payload;
            if (base64_decode(sig, decoded) && json_parse(decoded, payload) && json_get(payload, "payload")) {
                ++paid_retries;
                out.code = 200;
                out.headers["payment-response"] = settled;
                out.headers["content-type"] = "application/json";
                out.body = "{\"data\":42}";
            } else {
                out.code = 400;
            }
            return true;
        });
        PaymentEngine engine(f.store, f.http, f.wallet);

        FetchResult r = engine.fetch_with_payment(PAGE);
        TEST_CHECK(r.ok && r.has_payment && r.payment.mode == PaymentMode::PROTOCOL_402, "402 flow used");
        TEST_CHECK(r.payment.amount == "20000" && r.payment.tx_hash == "0x402tx", "402 terms and tx");
        TEST_CHECK(r.content == "{\"data\":42}" && r.status_code == 200, "retry content");
        TEST_CHECK(paid_retries == 1, "one paid retry");
        TEST_CHECK(f.http.count("GET", std::string(FACILITATOR) + "/supported") == 0, "inline offer ignored");
        std::vector<LedgerEntry> entries = engine.ledger().entries();
        TEST_CHECK(entries.size() == 1 && entries[0].mode == "402" && entries[0].amount == "20000", "402 ledger entry");

        // A retry without a settlement header gets a placeholder hash and no verification link
        f.http.on("GET", PAGE, [&](const HttpRequest& req, HttpResponse& out, std::string&) {
            if (request_header(req, "PAYMENT-SIGNATURE").empty()) {
                out.code = 402;
                out.headers["payment-required"] = base64_encode(required);
                return true;
            }
            out.code = 200;
            out.body = "{\"data\":43}";
            return true;
        });
        r = engine.fetch_with_payment(PAGE);
        TEST_CHECK(r.ok && r.payment.tx_hash == UNKNOWN_TX_HASH, "placeholder hash");
        Receipt rc;
        TEST_CHECK(engine.receipts().get(r.receipt_id, rc) && rc.stage == Ap2Stage::SETTLED && !rc.has_verification,
                   "no verification link for the placeholder");
        TEST_CHECK(engine.ledger().entries().size() == 2, "402 entry recorded");

        // A non-2xx retry records nothing
        f.http.on("GET", PAGE, [&](const HttpRequest&, HttpResponse& out, std::string&) {
            out.code = 402;
            out.headers["payment-required"] = base64_encode(required);
            return true;
        });
        r = engine.fetch_with_payment(PAGE);
        TEST_CHECK(!r.ok && r.error == ErrorCode::PAYMENT_ERROR, "rejected retry");
        TEST_CHECK(engine.ledger().entries().size() == 2, "no entry for a rejected retry");

        f.http.reply("GET", PAGE, 402, "Payment Required");
        r = engine.fetch_with_payment(PAGE);
        TEST_CHECK(!r.ok && r.error == ErrorCode::INVALID_META_TAG, "402 without terms");
    }

    // A second payment for the same context is refused while the first is in flight
    {
        Fixture f;
        TEST_CHECK(f.open(), "open store");
        f.budget("0.05", "");
        facilitator_routes(f.http);
        f.http.reply("GET", PAGE, 200, meta_page("client"));
        Gate gate;
        f.http.on("POST", std::string(FACILITATOR) + "/settle", [&](const HttpRequest&, HttpResponse& out, std::string&) {
            gate.wait_inside();
            out.code = 200;
            out.body = "{\"success\":true,\"transaction\":\"0xslow\"}";
            return true;
        });
        PaymentEngine engine(f.store, f.http, f.wallet);

        std::future<FetchResult> first = std::async(std::launch::async, [&] { return engine.fetch_with_payment(PAGE); });
        gate.wait_entered();
        TEST_CHECK(engine.in_progress(PAGE), "first payment marked in progress");
        FetchResult dup = engine.fetch_with_payment(PAGE);
        TEST_CHECK(!dup.ok && dup.error == ErrorCode::PAYMENT_IN_PROGRESS, "duplicate rejected");

        FetchOptions other;
        other.context = "tab-2";
        other.max_price = "0.05";
        f.http.reply("GET", "https://news.example/other", 200, "<html>free</html>");
        TEST_CHECK(engine.fetch_with_payment("https://news.example/other", other).ok, "other contexts proceed");

        gate.release();
        FetchResult done = first.get();
        TEST_CHECK(done.ok && done.payment.tx_hash == "0xslow", "first payment completes");
        TEST_CHECK(!engine.in_progress(PAGE), "mark cleared");
    }

    // Optimistic settlement completes in the background
    {
        Fixture f;
        TEST_CHECK(f.open(), "open store");
        f.budget("0.05", "");
        facilitator_routes(f.http);
        f.http.reply("GET", PAGE, 200, meta_page("client"));
        Events events;
        PaymentEngine engine(f.store, f.http, f.wallet);
        engine.set_listener(events.listener());

        FetchOptions fo;
        fo.optimistic = true;
        FetchResult r = engine.fetch_with_payment(PAGE, fo);
        TEST_CHECK(r.ok && r.payment.pending && !r.payment.request_id.empty(), "provisional result");
        TEST_CHECK(r.content.find("teaser") != std::string::npos, "page content returned immediately");
        TEST_CHECK(r.receipt_id.empty(), "receipt deferred to completion");
        engine.wait_idle();

        TEST_CHECK(events.count(SettlementEventKind::PROVISIONAL) == 1, "provisional event");
        TEST_CHECK(events.count(SettlementEventKind::CONFIRMED) == 1, "confirmed event");
        LedgerEntry e;
        TEST_CHECK(engine.ledger().find(r.payment.request_id, e) && e.status == EntryStatus::CONFIRMED &&
                   e.tx_hash == "0xsettled" && !e.settled_at.empty(), "entry confirmed in place");
        TEST_CHECK(engine.ledger().entries().size() == 1, "still one entry");
        TEST_CHECK(engine.pending().all().empty(), "marker removed");
        TEST_CHECK(!engine.in_progress(PAGE), "mark cleared");
        ReceiptFilter settled;
        settled.has_stage = true;
        settled.stage = Ap2Stage::SETTLED;
        TEST_CHECK(engine.receipts().list(settled).total == 1, "settled receipt on completion");

        // Background failure marks the entry failed and frees the budget
        f.http.reply("POST", std::string(FACILITATOR) + "/settle", 200, "{\"success\":false,\"errorReason\":\"reverted\"}");
        r = engine.fetch_with_payment(PAGE, fo);
        TEST_CHECK(r.ok && r.payment.pending, "provisional again");
        engine.wait_idle();
        TEST_CHECK(engine.ledger().find(r.payment.request_id, e) && e.status == EntryStatus::FAILED &&
                   e.error == "Settlement failed: reverted", "entry failed");
        TEST_CHECK(events.count(SettlementEventKind::FAILED) == 1, "failed event");
        TEST_CHECK(engine.ledger().totals().today == "10000", "failed spend does not count");
    }

    // The provisional event fires once the entry and marker are stored and the budget lock is free
    {
        Fixture f;
        TEST_CHECK(f.open(), "open store");
        f.budget("0.05", "");
        facilitator_routes(f.http);
        f.http.reply("GET", PAGE, 200, meta_page("client"));
        PaymentEngine engine(f.store, f.http, f.wallet);
        FileLock locks(f.store.root());

        bool entry_pending = false, marker_saved = false, budget_free = false;
        engine.set_listener([&](const SettlementEvent& ev) {
            if (ev.kind != SettlementEventKind::PROVISIONAL) return;
            LedgerEntry e;
            entry_pending = engine.ledger().find(ev.request_id, e) && e.status == EntryStatus::PENDING;
            for (const auto& m : engine.pending().all())
                if (m.request_id == ev.request_id) marker_saved = true;
            budget_free = !locks.is_locked("budget");
        });

        FetchOptions fo;
        fo.optimistic = true;
        FetchResult r = engine.fetch_with_payment(PAGE, fo);
        TEST_CHECK(r.ok && r.payment.pending, "provisional");
        engine.wait_idle();
        TEST_CHECK(entry_pending, "pending entry written before the event");
        TEST_CHECK(marker_saved, "marker written before the event");
        TEST_CHECK(budget_free, "budget lock released before the event");

        // A marker that cannot be written fails the payment and says so
        std::filesystem::create_directory(std::filesystem::path(f.store.root()) / "pending.lock");
        Events events;
        engine.set_listener(events.listener());
        r = engine.fetch_with_payment(PAGE, fo);
        TEST_CHECK(!r.ok && r.error == ErrorCode::STORAGE_ERROR, "marker failure surfaces");
        TEST_CHECK(events.count(SettlementEventKind::PROVISIONAL) == 0, "no provisional event");
        TEST_CHECK(events.count(SettlementEventKind::FAILED) == 1, "failed event");
        size_t failed = 0;
        for (const auto& e : engine.ledger().entries()) if (e.status == EntryStatus::FAILED) ++failed;
        TEST_CHECK(failed == 1, "entry marked failed");
        TEST_CHECK(!engine.in_progress(PAGE), "mark cleared");
    }

    // Finished background workers are joined without wait_idle
    {
        Fixture f;
        TEST_CHECK(f.open(), "open store");
        f.budget("0.05", "1");
        facilitator_routes(f.http);
        f.http.reply("GET", PAGE, 200, meta_page("client"));
        PaymentEngine engine(f.store, f.http, f.wallet);

        FetchOptions fo;
        fo.optimistic = true;
        for (int i = 0; i < 3; ++i) {
            FetchResult r = engine.fetch_with_payment(PAGE, fo);
            TEST_CHECK(r.ok && r.payment.pending, "provisional");
            TEST_CHECK(wait_until([&] { return !engine.in_progress(PAGE); }), "settlement finished");
        }
        TEST_CHECK(wait_until([&] { return engine.active_workers() == 0; }), "finished workers reaped");
        TEST_CHECK(engine.ledger().totals().today == "30000", "three payments settled");
    }

    // Concurrent payments on different contexts cannot both pass the daily cap
    {
        Fixture f;
        TEST_CHECK(f.open(), "open store");
        f.budget("0.05", "0.015");
        facilitator_routes(f.http);
        const std::string second = "https://news.example/second";
        f.http.reply("GET", PAGE, 200, meta_page("client"));
        f.http.reply("GET", second, 200, meta_page("client"));
        Gate gate;
        std::atomic<int> settles{0};
        f.http.on("POST", std::string(FACILITATOR) + "/settle", [&](const HttpRequest&, HttpResponse& out, std::string&) {
            if (settles++ == 0) gate.wait_inside();
            out.code = 200;
            out.body = "{\"success\":true,\"transaction\":\"0xfirst\"}";
            return true;
        });
        PaymentEngine engine(f.store, f.http, f.wallet);

        std::future<FetchResult> first = std::async(std::launch::async, [&] { return engine.fetch_with_payment(PAGE); });
        gate.wait_entered();
        FetchOptions other;
        other.context = "tab-2";
        std::future<FetchResult> racer = std::async(std::launch::async, [&] {
            return engine.fetch_with_payment(second, other);
        });
        TEST_CHECK(racer.wait_for(std::chrono::milliseconds(200)) == std::future_status::timeout,
                   "second payment waits at the budget gate");

        gate.release();
        FetchResult a = first.get();
        FetchResult b = racer.get();
        TEST_CHECK(a.ok && a.has_payment && a.payment.tx_hash == "0xfirst", "first payment settles");
        TEST_CHECK(!b.ok && b.error == ErrorCode::BUDGET_EXCEEDED && b.budget_reason == BudgetReason::DAILY,
                   "second payment declined on the daily cap");
        TEST_CHECK(settles == 1, "only one settlement");
        TEST_CHECK(engine.ledger().entries().size() == 1, "one ledger entry");
    }

    // A sweep from another process leaves a running settlement alone
    {
        Fixture f;
        TEST_CHECK(f.open(), "open store");
        f.budget("0.05", "1");
        facilitator_routes(f.http);
        f.http.reply("GET", PAGE, 200, meta_page("client"));
        Gate gate;
        f.http.on("POST", std::string(FACILITATOR) + "/settle", [&](const HttpRequest&, HttpResponse& out, std::string&) {
            gate.wait_inside();
            out.code = 200;
            out.body = "{\"success\":true,\"transaction\":\"0xlate\"}";
            return true;
        });

        PaymentEngine running(f.store, f.http, f.wallet);
        FetchOptions fo;
        fo.optimistic = true;
        FetchResult r = running.fetch_with_payment(PAGE, fo);
        TEST_CHECK(r.ok && r.payment.pending, "provisional");
        gate.wait_entered();
        TEST_CHECK(running.pending().all().size() == 1, "marker persisted");

        Events events;
        PaymentEngine other(f.store, f.http, f.wallet);
        other.set_listener(events.listener());
        TEST_CHECK(other.recover_pending() == 0, "running settlement not recovered");
        LedgerEntry e;
        TEST_CHECK(other.ledger().find(r.payment.request_id, e) && e.status == EntryStatus::PENDING, "still pending");
        TEST_CHECK(other.pending().all().size() == 1, "marker kept");
        TEST_CHECK(events.count(SettlementEventKind::FAILED) == 0, "no failure reported");
        TEST_CHECK(other.ledger().totals().today == "10000", "pending spend counts");

        gate.release();
        running.wait_idle();
        TEST_CHECK(other.ledger().find(r.payment.request_id, e) && e.status == EntryStatus::CONFIRMED &&
                   e.tx_hash == "0xlate", "settlement lands");
        TEST_CHECK(other.ledger().totals().today == "10000", "paid charge counts");
        TEST_CHECK(other.pending().all().empty(), "owner removed its marker");
        TEST_CHECK(other.recover_pending() == 0, "nothing left to sweep");
    }

    // Markers left behind by a dead process fail on the next start
    {
        Fixture f;
        TEST_CHECK(f.open(), "open store");
        Events events;
        PaymentEngine restarted(f.store, f.http, f.wallet);
        restarted.set_listener(events.listener());
        add_orphan(restarted, "5f0c7a52-0d5e-4f43-9d7a-1c1e1f6b2a01", 1000);
        add_orphan(restarted, "5f0c7a52-0d5e-4f43-9d7a-1c1e1f6b2a02", 120000);

        TEST_CHECK(restarted.recover_pending() == 2, "both orphans recovered");
        LedgerEntry e;
        TEST_CHECK(restarted.ledger().find("5f0c7a52-0d5e-4f43-9d7a-1c1e1f6b2a01", e) &&
                   e.status == EntryStatus::FAILED && e.error == "Settlement interrupted (process restarted)",
                   "interrupted");
        TEST_CHECK(restarted.ledger().find("5f0c7a52-0d5e-4f43-9d7a-1c1e1f6b2a02", e) &&
                   e.status == EntryStatus::FAILED && e.error == "Settlement timeout (process restarted)",
                   "timeout message");
        TEST_CHECK(events.count(SettlementEventKind::FAILED) == 2, "listener told");
        TEST_CHECK(restarted.pending().all().empty(), "markers removed");

        TEST_CHECK(restarted.recover_pending() == 0, "second sweep changes nothing");
        TEST_CHECK(events.count(SettlementEventKind::FAILED) == 2, "no second notification");

        // A completion arriving after recovery cannot resurrect the entry
        TEST_CHECK(!restarted.ledger().update_status("5f0c7a52-0d5e-4f43-9d7a-1c1e1f6b2a01", EntryStatus::CONFIRMED,
                                                     "0xlate", ""), "late completion ignored");
        TEST_CHECK(restarted.ledger().find("5f0c7a52-0d5e-4f43-9d7a-1c1e1f6b2a01", e) &&
                   e.status == EntryStatus::FAILED, "still failed");
    }

    ::unsetenv(PRIVATE_KEY_ENV);
    std::printf("test_payment_engine: OK\n");
    return 0;
}
