#include "errors.h"

namespace tollgate {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "ok";
        case ErrorCode::NO_WALLET: return "no_wallet";
        case ErrorCode::DECRYPT_FAILED: return "decrypt_failed";
        case ErrorCode::NO_BUDGET: return "no_budget";
        case ErrorCode::MAX_PRICE_EXCEEDED: return "max_price_exceeded";
        case ErrorCode::BUDGET_EXCEEDED: return "budget_exceeded";
        case ErrorCode::ASSET_MISMATCH: return "asset_mismatch";
        case ErrorCode::MISSING_PAYMENT_URL: return "missing_payment_url";
        case ErrorCode::FACILITATOR_ERROR: return "facilitator_error";
        case ErrorCode::SETTLE_FAILED: return "settle_failed";
        case ErrorCode::VERIFY_FAILED: return "verify_failed";
        case ErrorCode::PAYMENT_URL_ERROR: return "payment_url_error";
        case ErrorCode::NETWORK_ERROR: return "network_error";
        case ErrorCode::TIMEOUT: return "timeout";
        case ErrorCode::INVALID_META_TAG: return "invalid_meta_tag";
        case ErrorCode::UNSUPPORTED_NETWORK: return "unsupported_network";
        case ErrorCode::INVALID_URL: return "invalid_url";
        case ErrorCode::PAYMENT_IN_PROGRESS: return "payment_in_progress";
        case ErrorCode::PAYMENT_ERROR: return "payment_error";
        case ErrorCode::UNKNOWN_ENCRYPTION_MODE: return "unknown_encryption_mode";
        case ErrorCode::DERIVE_KEY_FAILED: return "derive_key_failed";
        case ErrorCode::ENCRYPTION_FAILED: return "encryption_failed";
        case ErrorCode::WEAK_PASSWORD: return "weak_password";
        case ErrorCode::PROMPT_CANCELLED: return "prompt_cancelled";
        case ErrorCode::INVALID_PRIVATE_KEY: return "invalid_private_key";
        case ErrorCode::WALLET_EXISTS: return "wallet_exists";
        case ErrorCode::STORAGE_ERROR: return "storage_error";
        case ErrorCode::LOCK_TIMEOUT: return "lock_timeout";
        case ErrorCode::INVALID_AMOUNT: return "invalid_amount";
    }
    return "unknown_error";
}

int exit_code_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return 0;
        case ErrorCode::BUDGET_EXCEEDED:
        case ErrorCode::MAX_PRICE_EXCEEDED:
        case ErrorCode::NO_BUDGET:
        case ErrorCode::UNSUPPORTED_NETWORK:
            return 2;
        case ErrorCode::NO_WALLET:
        case ErrorCode::DECRYPT_FAILED:
            return 3;
        default:
            return 1;
    }
}

}
