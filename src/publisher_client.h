#pragma once
#include "http_client.h"
#include "json.h"

#include <string>

namespace tollgate {

struct PublisherPaymentResult {
    std::string tx_hash;
    std::string content;
    std::string content_type;
};

// Server-mode relay: POST {paymentPayload} to the publisher, which settles and
// returns the gated content. Every failure is EngineError(PAYMENT_URL_ERROR)
// except a disallowed URL, which is INVALID_URL.
PublisherPaymentResult submit_payment(HttpTransport& http, const std::string& payment_url,
                                      const JNode& payment_payload, int timeout_ms = 30000);

}
