#pragma once
#include "blob_store.h"
#include "history.h"

#include <string>

namespace tollgate {

static constexpr const char* BUDGET_FILE = "budget.json";

// Decimal USDC strings; empty means the limit is not set.
struct BudgetConfig {
    std::string per_request_max;
    std::string daily_max;
    std::string total_max;
};

enum class BudgetReason { NONE, NO_BUDGET, MAX_PRICE, PER_REQUEST, DAILY, TOTAL };
const char* budget_reason_to_string(BudgetReason r);

struct BudgetCheck {
    bool         allowed{false};
    BudgetReason reason{BudgetReason::NONE};
    std::string  limit;  // smallest unit, set for every rejection but no_budget
    std::string  spent;  // smallest unit, set for daily and total
};

// Persisted limits. set() merges non-empty fields of `partial` into the stored record.
class BudgetStore {
public:
    explicit BudgetStore(BlobStore& store) : store_(store) {}

    // False when no budget has been configured.
    bool get(BudgetConfig& out) const;
    // Throws EngineError(INVALID_AMOUNT) for a malformed limit, STORAGE_ERROR on write failure.
    BudgetConfig set(const BudgetConfig& partial);

private:
    BlobStore& store_;
};

// Pure limit evaluation. `config` is nullptr when no budget exists; `max_price`
// is decimal USDC or empty. Throws EngineError(INVALID_AMOUNT) on malformed input.
BudgetCheck evaluate_budget(const BudgetConfig* config, const std::string& amount,
                            const std::string& max_price, const SpendingTotals& totals);

// Reads the stored limits and ledger totals; mutates nothing.
BudgetCheck check_budget(const BudgetStore& budgets, const SpendingLedger& ledger,
                         const std::string& amount, const std::string& max_price);

}
