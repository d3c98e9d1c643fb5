#pragma once
#include "json.h"

#include <map>
#include <string>
#include <vector>

namespace tollgate {

enum class PaymentMode { CLIENT, SERVER, PROTOCOL_402 };
const char* payment_mode_to_string(PaymentMode m);

// One entry of an offer's `accepts` list.
struct AcceptedPayment {
    std::string scheme{"exact"};
    std::string network;
    std::string amount;   // smallest unit, decimal digits
    std::string asset;
    std::string pay_to;
    int         max_timeout_seconds{300};
    JNode       extra;    // 402 requirements carry the EIP-712 domain name/version here
};

// Normalized payment terms from either signal form.
struct PaymentOffer {
    int         x402_version{2};
    PaymentMode mode{PaymentMode::CLIENT};
    std::string facilitator_url;
    std::string site_key;
    std::string payment_url;
    bool        optimistic{true};
    std::vector<AcceptedPayment> accepts;
    JNode       resource;  // 402 only: the server's resource object, echoed back
};

enum class SignalKind { NONE, PROTOCOL_402, INLINE };

struct Signal {
    SignalKind   kind{SignalKind::NONE};
    PaymentOffer offer;
};

// Inline parsers, tried by detect() in this order. Malformed input yields false.
bool parse_meta_tag(const std::string& html, PaymentOffer& out);
bool parse_script_tag(const std::string& html, PaymentOffer& out);
bool parse_init_call(const std::string& html, PaymentOffer& out);

// PAYMENT-REQUIRED header (base64 JSON, any version) or a v1 JSON body.
bool parse_payment_required(const std::map<std::string,std::string>& headers,
                            const std::string& body, PaymentOffer& out);

// A 402 status always wins over inline markup. A 402 whose terms cannot be
// parsed is still PROTOCOL_402 with an empty accepts list.
Signal detect(int status, const std::map<std::string,std::string>& headers, const std::string& body);

}
