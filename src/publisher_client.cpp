#include "publisher_client.h"
#include "errors.h"
#include "log.h"
#include "url.h"

namespace tollgate {

PublisherPaymentResult submit_payment(HttpTransport& http, const std::string& payment_url,
                                      const JNode& payment_payload, int timeout_ms) {
    assert_allowed_url(payment_url, "Payment URL");

    JObject body;
    body["paymentPayload"] = payment_payload;

    HttpRequest req;
    req.method = "POST";
    req.url = payment_url;
    req.timeout_ms = timeout_ms;
    req.headers.emplace_back("Content-Type", "application/json");
    req.body = json_dump(jobj(std::move(body)));

    log_info(LogCategory::ENGINE, "submitting payment to publisher: " + payment_url);
    HttpResponse resp;
    std::string err;
    if (!http.send(req, resp, err)) {
        throw EngineError(ErrorCode::PAYMENT_URL_ERROR, "Payment URL error: " + err);
    }
    if (resp.code < 200 || resp.code > 299) {
        throw EngineError(ErrorCode::PAYMENT_URL_ERROR, "Payment URL HTTP error: " + std::to_string(resp.code));
    }

    JNode data;
    if (!json_parse(resp.body, data) || !json_is_object(data)) {
        throw EngineError(ErrorCode::PAYMENT_URL_ERROR, "Payment URL error: invalid JSON response");
    }
    bool success = false;
    json_get_bool(data, "success", success);
    if (!success) {
        throw EngineError(ErrorCode::PAYMENT_URL_ERROR,
                          "Payment URL error: " + json_string_or(data, "error", "unknown"));
    }

    PublisherPaymentResult r;
    r.tx_hash = json_string_or(data, "txHash");
    r.content = json_string_or(data, "content");
    r.content_type = json_string_or(data, "contentType", "text/html");
    return r;
}

}
