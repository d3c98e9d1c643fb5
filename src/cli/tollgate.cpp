// tollgate: command-line front end for the payment engine.
#include "amount.h"
#include "budget.h"
#include "config.h"
#include "errors.h"
#include "history.h"
#include "http_client.h"
#include "json.h"
#include "log.h"
#include "paths.h"
#include "payment_engine.h"
#include "receipts.h"
#include "wallet/key_cache.h"
#include "wallet/password_prompt.h"
#include "wallet/wallet_file.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

using namespace tollgate;

namespace {

constexpr const char* CONFIG_FILE = "tollgate.conf";

void usage() {
    std::cerr <<
        "Usage: tollgate [--datadir=DIR] <command> [args]\n\n"
        "Commands:\n"
        "  fetch <url> [--max-price X] [--network N] [--timeout MS] [--optimistic] [--context C]\n"
        "  wallet create [--mode M] [--network N] [--force]\n"
        "  wallet import <hex-key> [--mode M] [--network N] [--force]\n"
        "  wallet address\n"
        "  wallet migrate <mode>\n"
        "  wallet remove\n"
        "  budget set [--per-request X] [--daily X] [--total X]\n"
        "  budget show\n"
        "  history [n]\n"
        "  receipts [--stage intent|settled|declined] [--limit N]\n"
        "  recover\n\n"
        "Wallet modes: machine-bound (default), password, env-injected\n"
        "Environment: TOLLGATE_HOME, TOLLGATE_PRIVATE_KEY, TOLLGATE_WALLET_KEY\n";
}

// Splits argv into positionals and --key[=value] options. Flags in `bare`
// take no value; every other option consumes the next argument when no '=' is given.
struct Args {
    std::vector<std::string> pos;
    std::vector<std::pair<std::string,std::string>> opts;

    bool has(const std::string& k) const {
        for (const auto& o : opts) if (o.first == k) return true;
        return false;
    }
    std::string get(const std::string& k, const std::string& def = "") const {
        for (const auto& o : opts) if (o.first == k) return o.second;
        return def;
    }
};

Args parse_args(int argc, char** argv, int start) {
    static const char* bare[] = {"optimistic", "force", "help", nullptr};
    Args a;
    for (int i = start; i < argc; ++i) {
        std::string s = argv[i];
        if (s.rfind("--", 0) != 0 || s.size() == 2) { a.pos.push_back(s); continue; }
        s = s.substr(2);
        auto eq = s.find('=');
        if (eq != std::string::npos) { a.opts.emplace_back(s.substr(0, eq), s.substr(eq + 1)); continue; }
        bool is_bare = false;
        for (const char** b = bare; *b; ++b) if (s == *b) is_bare = true;
        if (!is_bare && i + 1 < argc) a.opts.emplace_back(s, argv[++i]);
        else a.opts.emplace_back(s, "");
    }
    return a;
}

int fail(ErrorCode code, const std::string& message) {
    std::cerr << "error: " << error_code_to_string(code) << ": " << message << "\n";
    return exit_code_for(code);
}

std::string interactive_password(const std::string& address) {
    return prompt_password("Wallet password for " + address + ": ");
}

int cmd_fetch(PaymentEngine& engine, const Config& cfg, const Args& a) {
    if (a.pos.size() < 2) { usage(); return 1; }
    FetchOptions fo;
    fo.max_price = a.get("max-price", cfg.max_price);
    fo.network = a.get("network");
    fo.timeout_ms = std::atoi(a.get("timeout", std::to_string(cfg.timeout_ms)).c_str());
    fo.optimistic = cfg.optimistic || a.has("optimistic");
    fo.context = a.get("context");

    engine.set_listener([](const SettlementEvent& ev) {
        log_info(LogCategory::ENGINE, std::string("settlement ") + settlement_event_to_string(ev.kind) +
                 " " + ev.request_id + (ev.error.empty() ? "" : ": " + ev.error));
    });

    FetchResult r = engine.fetch_with_payment(a.pos[1], fo);
    if (!r.ok) return fail(r.error, r.message);

    if (r.has_payment) {
        std::cerr << "paid " << r.payment.amount_formatted << " USDC on " << r.payment.network
                  << " (" << payment_mode_to_string(r.payment.mode) << ")";
        if (r.payment.pending) std::cerr << ", settlement " << r.payment.request_id << " pending";
        else std::cerr << ", tx " << r.payment.tx_hash;
        std::cerr << "\n";
    }
    std::cout << r.content;
    std::cout.flush();
    // Optimistic settlements finish before the process exits.
    engine.wait_idle();
    return 0;
}

int cmd_wallet(Wallet& wallet, const Config& cfg, const Args& a) {
    if (a.pos.size() < 2) { usage(); return 1; }
    const std::string& sub = a.pos[1];

    auto options = [&]() {
        WalletOptions wo;
        wo.network = a.get("network", cfg.network);
        wo.force = a.has("force");
        const std::string m = a.get("mode", "machine-bound");
        if (!encryption_mode_from_string(m, wo.mode))
            throw EngineError(ErrorCode::UNKNOWN_ENCRYPTION_MODE, "Unknown encryption mode: " + m);
        return wo;
    };
    auto print = [](const WalletInfo& w) {
        std::cout << "address: " << w.address << "\n"
                  << "network: " << w.network << "\n"
                  << "mode:    " << encryption_mode_to_string(w.mode) << "\n"
                  << "file:    " << w.storage_path << "\n";
    };

    if (sub == "create") { print(wallet.create(options())); return 0; }
    if (sub == "import") {
        if (a.pos.size() < 3) { usage(); return 1; }
        print(wallet.import_key(a.pos[2], options()));
        return 0;
    }
    if (sub == "address") { std::cout << wallet.address() << "\n"; return 0; }
    if (sub == "migrate") {
        if (a.pos.size() < 3) { usage(); return 1; }
        EncryptionModeName m;
        if (!encryption_mode_from_string(a.pos[2], m))
            throw EngineError(ErrorCode::UNKNOWN_ENCRYPTION_MODE, "Unknown encryption mode: " + a.pos[2]);
        print(wallet.migrate(m, a.get("password")));
        return 0;
    }
    if (sub == "remove") {
        if (!wallet.remove()) return fail(ErrorCode::NO_WALLET, "No wallet to remove");
        std::cout << "wallet removed\n";
        return 0;
    }
    usage();
    return 1;
}

int cmd_budget(BudgetStore& budgets, const Args& a) {
    if (a.pos.size() < 2) { usage(); return 1; }
    auto show = [](const BudgetConfig& b) {
        auto v = [](const std::string& s) { return s.empty() ? std::string("none") : s + " USDC"; };
        std::cout << "per-request: " << v(b.per_request_max) << "\n"
                  << "daily:       " << v(b.daily_max) << "\n"
                  << "total:       " << v(b.total_max) << "\n";
    };
    if (a.pos[1] == "set") {
        BudgetConfig partial;
        partial.per_request_max = a.get("per-request");
        partial.daily_max = a.get("daily");
        partial.total_max = a.get("total");
        show(budgets.set(partial));
        return 0;
    }
    if (a.pos[1] == "show") {
        BudgetConfig b;
        if (!budgets.get(b)) { std::cout << "no budget configured\n"; return 0; }
        show(b);
        return 0;
    }
    usage();
    return 1;
}

int cmd_history(SpendingLedger& ledger, const Args& a) {
    size_t n = 20;
    if (a.pos.size() >= 2) n = (size_t)std::strtoul(a.pos[1].c_str(), nullptr, 10);
    for (const auto& e : ledger.recent(n)) {
        std::cout << e.ts << "  " << smallest_to_usdc(e.amount) << " USDC  " << e.mode << "  "
                  << (e.status == EntryStatus::NONE ? "confirmed" : entry_status_to_string(e.status))
                  << "  " << e.url;
        if (!e.tx_hash.empty()) std::cout << "  " << e.tx_hash;
        if (!e.error.empty()) std::cout << "  (" << e.error << ")";
        std::cout << "\n";
    }
    SpendingTotals t = ledger.totals();
    std::cout << "today: " << smallest_to_usdc(t.today) << " USDC, lifetime: "
              << smallest_to_usdc(t.lifetime) << " USDC\n";
    return 0;
}

int cmd_receipts(ReceiptLog& log, const Args& a) {
    ReceiptFilter f;
    if (a.has("stage")) {
        if (!ap2_stage_from_string(a.get("stage"), f.stage)) { usage(); return 1; }
        f.has_stage = true;
    }
    if (a.has("limit")) f.limit = (size_t)std::strtoul(a.get("limit").c_str(), nullptr, 10);
    f.agent_id = a.get("agent");
    ReceiptPage page = log.list(f);
    for (const auto& r : page.receipts)
        std::cout << json_dump(receipt_to_json(r)) << "\n";
    std::cerr << page.receipts.size() << " of " << page.total << " receipts"
              << (page.has_more ? " (more available)" : "") << "\n";
    return 0;
}

}

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);

    std::string datadir;
    int first = 1;
    for (; first < argc; ++first) {
        std::string s = argv[first];
        if (s.rfind("--datadir=", 0) == 0) { datadir = s.substr(10); continue; }
        if (s == "--help" || s == "-h") { usage(); return 0; }
        break;
    }
    if (first >= argc) { usage(); return 1; }

    Config cfg;
    if (datadir.empty()) datadir = default_data_dir();
    if (load_config(join_path(datadir, CONFIG_FILE), cfg) && !cfg.datadir.empty() && cfg.datadir != datadir) {
        datadir = cfg.datadir;
    }

    LogLevel lvl = LogLevel::INFO;
    if (!log_level_from_string(cfg.log_level, lvl))
        log_warn("unknown log_level '" + cfg.log_level + "', using info");
    log_set_level(lvl);
    log_enable_timestamps(cfg.log_timestamps);

    KeyCache::install_exit_wipe();

    FileBlobStore store(datadir);
    std::string err;
    if (!store.open(err)) return fail(ErrorCode::STORAGE_ERROR, err);

    Args a = parse_args(argc, argv, first);
    const std::string cmd = a.pos.empty() ? std::string() : a.pos[0];

    try {
        Wallet wallet(store, interactive_password);
        if (cmd == "wallet") return cmd_wallet(wallet, cfg, a);

        BudgetStore budgets(store);
        if (cmd == "budget") return cmd_budget(budgets, a);

        HttpClient http;
        EngineSettings es;
        es.skip_verify = cfg.skip_verify;
        es.record_receipts = cfg.receipts;
        es.agent_id = cfg.agent_id;
        PaymentEngine engine(store, http, wallet, es);

        size_t recovered = engine.recover_pending();
        if (recovered) log_warn(LogCategory::ENGINE, std::to_string(recovered) + " interrupted settlement(s) marked failed");

        if (cmd == "fetch") return cmd_fetch(engine, cfg, a);
        if (cmd == "history") return cmd_history(engine.ledger(), a);
        if (cmd == "receipts") return cmd_receipts(engine.receipts(), a);
        if (cmd == "recover") {
            std::cout << recovered << " pending settlement(s) recovered\n";
            return 0;
        }
    } catch (const EngineError& e) {
        return fail(e.code(), e.detail().empty() ? e.what() : e.detail());
    } catch (const std::exception& e) {
        return fail(ErrorCode::PAYMENT_ERROR, e.what());
    }
    usage();
    return 1;
}
