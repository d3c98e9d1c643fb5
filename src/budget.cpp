#include "budget.h"
#include "amount.h"
#include "errors.h"
#include "json.h"
#include "log.h"

namespace tollgate {

const char* budget_reason_to_string(BudgetReason r) {
    switch (r) {
        case BudgetReason::NONE:        return "";
        case BudgetReason::NO_BUDGET:   return "no_budget";
        case BudgetReason::MAX_PRICE:   return "max_price";
        case BudgetReason::PER_REQUEST: return "per_request";
        case BudgetReason::DAILY:       return "daily";
        case BudgetReason::TOTAL:       return "total";
    }
    return "";
}

static Amount usdc_limit(const std::string& usdc, const char* what) {
    Amount a;
    if (!usdc_to_smallest(usdc, a)) {
        throw EngineError(ErrorCode::INVALID_AMOUNT, std::string("invalid ") + what + ": " + usdc);
    }
    return a;
}

bool BudgetStore::get(BudgetConfig& out) const {
    std::string raw;
    if (!store_.get(BUDGET_FILE, raw)) return false;
    JNode j;
    if (!json_parse(raw, j) || !json_is_object(j)) {
        log_warn(LogCategory::BUDGET, "budget.json is not a JSON object; treating as unset");
        return false;
    }
    out.per_request_max = json_string_or(j, "perRequestMax");
    out.daily_max = json_string_or(j, "dailyMax");
    out.total_max = json_string_or(j, "totalMax");
    return true;
}

BudgetConfig BudgetStore::set(const BudgetConfig& partial) {
    if (!partial.per_request_max.empty()) usdc_limit(partial.per_request_max, "perRequestMax");
    if (!partial.daily_max.empty()) usdc_limit(partial.daily_max, "dailyMax");
    if (!partial.total_max.empty()) usdc_limit(partial.total_max, "totalMax");

    BudgetConfig merged;
    get(merged);
    if (!partial.per_request_max.empty()) merged.per_request_max = partial.per_request_max;
    if (!partial.daily_max.empty()) merged.daily_max = partial.daily_max;
    if (!partial.total_max.empty()) merged.total_max = partial.total_max;

    JObject o;
    if (!merged.per_request_max.empty()) o["perRequestMax"] = jstr(merged.per_request_max);
    if (!merged.daily_max.empty()) o["dailyMax"] = jstr(merged.daily_max);
    if (!merged.total_max.empty()) o["totalMax"] = jstr(merged.total_max);
    std::string err;
    if (!store_.put(BUDGET_FILE, json_dump(jobj(std::move(o))), err)) {
        throw EngineError(ErrorCode::STORAGE_ERROR, "budget write failed: " + err);
    }
    return merged;
}

static BudgetCheck reject(BudgetReason reason, const Amount* limit = nullptr, const Amount* spent = nullptr) {
    BudgetCheck c;
    c.allowed = false;
    c.reason = reason;
    if (limit) c.limit = limit->to_string();
    if (spent) c.spent = spent->to_string();
    return c;
}

BudgetCheck evaluate_budget(const BudgetConfig* config, const std::string& amount_str,
                            const std::string& max_price, const SpendingTotals& totals) {
    Amount amount;
    if (!Amount::parse(amount_str, amount)) {
        throw EngineError(ErrorCode::INVALID_AMOUNT, "invalid amount: " + amount_str);
    }

    if (!config && max_price.empty()) return reject(BudgetReason::NO_BUDGET);

    if (!max_price.empty()) {
        const Amount limit = usdc_limit(max_price, "max price");
        if (amount > limit) return reject(BudgetReason::MAX_PRICE, &limit);
    }
    if (!config) {
        BudgetCheck ok;
        ok.allowed = true;
        return ok;
    }

    if (!config->per_request_max.empty()) {
        const Amount limit = usdc_limit(config->per_request_max, "perRequestMax");
        if (amount > limit) return reject(BudgetReason::PER_REQUEST, &limit);
    }
    if (!config->daily_max.empty()) {
        const Amount limit = usdc_limit(config->daily_max, "dailyMax");
        Amount spent;
        if (!Amount::parse(totals.today, spent)) spent = Amount();
        if (spent + amount > limit) return reject(BudgetReason::DAILY, &limit, &spent);
    }
    if (!config->total_max.empty()) {
        const Amount limit = usdc_limit(config->total_max, "totalMax");
        Amount spent;
        if (!Amount::parse(totals.lifetime, spent)) spent = Amount();
        if (spent + amount > limit) return reject(BudgetReason::TOTAL, &limit, &spent);
    }

    BudgetCheck ok;
    ok.allowed = true;
    return ok;
}

BudgetCheck check_budget(const BudgetStore& budgets, const SpendingLedger& ledger,
                         const std::string& amount, const std::string& max_price) {
    BudgetConfig cfg;
    const bool have = budgets.get(cfg);
    SpendingTotals totals;
    if (have && (!cfg.daily_max.empty() || !cfg.total_max.empty())) totals = ledger.totals();
    BudgetCheck c = evaluate_budget(have ? &cfg : nullptr, amount, max_price, totals);
    if (c.allowed) {
        TOLLGATE_LOG_DEBUG(LogCategory::BUDGET, "budget check ok for " + amount);
    } else {
        log_info(LogCategory::BUDGET, std::string("budget check declined: ") + budget_reason_to_string(c.reason));
    }
    return c;
}

}
