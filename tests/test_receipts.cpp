#include "test_support.h"

#include "blob_store.h"
#include "receipts.h"

#include <string>

using namespace tollgate;
using testing_support::TempDir;

static AuthorizationContext auth_snapshot() {
    AuthorizationContext a;
    a.per_request_limit = "0.05";
    a.daily_limit = "1.00";
    a.daily_spent = "0.20";
    a.total_spent = "3.10";
    a.requested_amount = "0.01";
    a.authorized_at = "2026-03-01T10:00:00.000Z";
    return a;
}

int main(){
    // Pure construction
    {
        SettlementContext s;
        s.tx_hash = "0xabc";
        s.network = "eip155:324705682";
        s.amount = "10000";
        s.amount_formatted = "0.01";
        s.currency = "0x2e08028E3C4c2356572E096d8EF835cD5C6030bD";
        Receipt r = make_settled_receipt("https://news.example/a", "agent-7", auth_snapshot(), s);
        TEST_CHECK(r.stage == Ap2Stage::SETTLED && r.has_settlement, "settled receipt");
        TEST_CHECK(r.has_verification, "verification attached with a tx hash");
        TEST_CHECK(r.explorer_url == "https://base-sepolia-testnet-explorer.skalenodes.com/tx/0xabc", "explorer url");
        TEST_CHECK(!r.id.empty(), "receipt id");

        s.tx_hash.clear();
        Receipt no_tx = make_settled_receipt("https://news.example/a", "", auth_snapshot(), s);
        TEST_CHECK(!no_tx.has_verification, "no verification without a tx hash");

        s.tx_hash = UNKNOWN_TX_HASH;
        Receipt unknown_tx = make_settled_receipt("https://api.example/data", "", auth_snapshot(), s);
        TEST_CHECK(unknown_tx.has_settlement && !unknown_tx.has_verification, "no verification for a placeholder hash");
        TEST_CHECK(unknown_tx.explorer_url.empty(), "no explorer link to /tx/unknown");

        s.tx_hash = "0xdef";
        s.network = "eip155:8453";
        TEST_CHECK(make_settled_receipt("u", "", auth_snapshot(), s).explorer_url == "https://blockscan.com/tx/0xdef",
                   "fallback explorer");

        DeclineContext d;
        d.reason = "budget_exceeded";
        d.limit = "daily";
        d.limit_value = "1.00";
        d.requested_amount = "0.01";
        Receipt dec = make_declined_receipt("https://news.example/b", "agent-7", auth_snapshot(), d);
        TEST_CHECK(dec.stage == Ap2Stage::DECLINED && dec.has_decline && dec.decline.limit == "daily", "declined");
        TEST_CHECK(!dec.has_settlement && !dec.has_verification, "decline has no settlement");

        JNode j = receipt_to_json(dec);
        TEST_CHECK(json_string_or(j, "stage") == "declined", "stage string");
        const JNode* auth = json_get(j, "authorization");
        TEST_CHECK(auth && json_string_or(*auth, "dailySpent") == "0.20", "authorization snapshot");
        TEST_CHECK(auth && json_get(*auth, "totalLimit") && json_is_null(*json_get(*auth, "totalLimit")),
                   "unset limit is null");
        Receipt back;
        TEST_CHECK(receipt_from_json(j, back) && back.id == dec.id && back.decline.limit_value == "1.00", "parse back");

        Ap2Stage st;
        TEST_CHECK(ap2_stage_from_string("intent", st) && st == Ap2Stage::INTENT, "stage parse");
        TEST_CHECK(!ap2_stage_from_string("refunded", st), "unknown stage");
    }

    // Log listing: newest first, filters, paging
    {
        TempDir dir;
        FileBlobStore store(dir.path());
        std::string err;
        TEST_CHECK(store.open(err), "open store");
        ReceiptLog log(store);

        std::vector<std::string> ids;
        for (int i = 0; i < 5; ++i) {
            Receipt r = make_intent_receipt("https://site.example/" + std::to_string(i),
                                            i % 2 ? "agent-a" : "agent-b", auth_snapshot());
            TEST_CHECK(log.append(r), "append");
            ids.push_back(r.id);
        }
        DeclineContext d;
        d.reason = "no_budget";
        d.limit = "no_budget";
        d.limit_value = "0.00";
        Receipt dec = make_declined_receipt("https://site.example/paid", "agent-a", auth_snapshot(), d);
        TEST_CHECK(log.append(dec), "append decline");
        TEST_CHECK(store.append_line(RECEIPTS_FILE, "{broken", err), "append junk line");

        ReceiptFilter all;
        ReceiptPage p = log.list(all);
        TEST_CHECK(p.total == 6 && p.receipts.size() == 6 && !p.has_more, "all receipts, junk skipped");
        TEST_CHECK(p.receipts[0].id == dec.id, "newest first");

        ReceiptFilter by_stage;
        by_stage.has_stage = true;
        by_stage.stage = Ap2Stage::DECLINED;
        p = log.list(by_stage);
        TEST_CHECK(p.total == 1 && p.receipts[0].decline.reason == "no_budget", "stage filter");

        ReceiptFilter by_agent;
        by_agent.agent_id = "agent-a";
        TEST_CHECK(log.list(by_agent).total == 3, "agent filter");

        ReceiptFilter page;
        page.limit = 2;
        page.offset = 2;
        p = log.list(page);
        TEST_CHECK(p.receipts.size() == 2 && p.total == 6 && p.has_more, "paging");
        TEST_CHECK(p.receipts[0].id == ids[3], "offset counts from newest");

        ReceiptFilter window;
        window.start = "2000-01-01";
        window.end = "2000-12-31";
        TEST_CHECK(log.list(window).total == 0, "date window excludes everything");

        Receipt got;
        TEST_CHECK(log.get(ids[1], got) && got.url == "https://site.example/1", "get by id");
        TEST_CHECK(!log.get("missing", got), "get unknown id");
    }

    std::printf("test_receipts: OK\n");
    return 0;
}
