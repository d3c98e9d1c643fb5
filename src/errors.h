#pragma once
#include <exception>
#include <string>

namespace tollgate {

// Caller-visible failure codes. The string form is what results and the CLI report.
enum class ErrorCode {
    NONE = 0,
    NO_WALLET,
    DECRYPT_FAILED,
    NO_BUDGET,
    MAX_PRICE_EXCEEDED,
    BUDGET_EXCEEDED,
    ASSET_MISMATCH,
    MISSING_PAYMENT_URL,
    FACILITATOR_ERROR,
    SETTLE_FAILED,
    VERIFY_FAILED,
    PAYMENT_URL_ERROR,
    NETWORK_ERROR,
    TIMEOUT,
    INVALID_META_TAG,
    UNSUPPORTED_NETWORK,
    INVALID_URL,
    PAYMENT_IN_PROGRESS,
    PAYMENT_ERROR,
    UNKNOWN_ENCRYPTION_MODE,
    DERIVE_KEY_FAILED,
    ENCRYPTION_FAILED,
    WEAK_PASSWORD,
    PROMPT_CANCELLED,
    INVALID_PRIVATE_KEY,
    WALLET_EXISTS,
    STORAGE_ERROR,
    LOCK_TIMEOUT,
    INVALID_AMOUNT
};

const char* error_code_to_string(ErrorCode code);

// Process exit status for the CLI: 2 budget/network policy, 3 wallet, 1 everything else.
int exit_code_for(ErrorCode code);

class EngineError : public std::exception {
private:
    ErrorCode code_;
    std::string detail_;
    std::string message_;

public:
    EngineError(ErrorCode code, const std::string& detail = "")
        : code_(code), detail_(detail) {
        message_ = std::string(error_code_to_string(code));
        if (!detail.empty()) {
            message_ += ": " + detail;
        }
    }

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const { return code_; }
    // Message without the code prefix
    const std::string& detail() const { return detail_; }
};

}
