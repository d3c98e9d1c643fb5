#include "test_support.h"

#include "base64.h"
#include "signal_detector.h"

#include <map>
#include <string>

using namespace tollgate;

static const char* USDC = "0x2e08028E3C4c2356572E096d8EF835cD5C6030bD";
static const char* PAY_TO = "0x7E5F4552091A69125d5DFCb7b8C2659029395Bdf";

static std::string meta_page(const std::string& json, const std::string& extra_attrs = "") {
    return "<html><head><meta name=\"x402-payment-required\" content=\"" + base64_encode(json) + "\"" +
           extra_attrs + "></head><body>teaser</body></html>";
}

static std::string offer_json(const std::string& mode, const std::string& tail = "") {
    return std::string("{\"x402Version\":2,\"mode\":\"") + mode +
           "\",\"facilitatorUrl\":\"https://facilitator.example\",\"siteKey\":\"sk_live_1\"" + tail +
           ",\"accepts\":[{\"scheme\":\"exact\",\"network\":\"eip155:324705682\",\"amount\":\"10000\","
           "\"asset\":\"" + USDC + "\",\"payTo\":\"" + PAY_TO + "\"}]}";
}

int main(){
    const std::map<std::string,std::string> no_headers;

    // Meta tag
    {
        Signal s = detect(200, no_headers, meta_page(offer_json("client")));
        TEST_CHECK(s.kind == SignalKind::INLINE, "meta tag detected");
        TEST_CHECK(s.offer.mode == PaymentMode::CLIENT, "client mode");
        TEST_CHECK(s.offer.facilitator_url == "https://facilitator.example", "facilitator url");
        TEST_CHECK(s.offer.site_key == "sk_live_1", "site key");
        TEST_CHECK(s.offer.accepts.size() == 1 && s.offer.accepts[0].amount == "10000", "accepts parsed");
        TEST_CHECK(s.offer.optimistic, "optimistic allowed by default");

        s = detect(200, no_headers, meta_page(offer_json("server", ",\"paymentUrl\":\"https://pub.example/pay\"")));
        TEST_CHECK(s.kind == SignalKind::INLINE && s.offer.mode == PaymentMode::SERVER, "server mode");
        TEST_CHECK(s.offer.payment_url == "https://pub.example/pay", "payment url");

        PaymentOffer o;
        TEST_CHECK(parse_meta_tag(meta_page(offer_json("client"), " data-optimistic=\"false\""), o) && !o.optimistic,
                   "page can opt out of optimistic settlement");

        TEST_CHECK(!parse_meta_tag(meta_page("{\"x402Version\":1,\"mode\":\"client\"}"), o), "wrong version");
        TEST_CHECK(!parse_meta_tag(meta_page(offer_json("hybrid")), o), "unknown mode");
        TEST_CHECK(!parse_meta_tag("<meta name=\"x402-payment-required\" content=\"%%%\">", o), "bad base64");
        TEST_CHECK(!parse_meta_tag(meta_page(
            "{\"x402Version\":2,\"mode\":\"client\",\"facilitatorUrl\":\"https://f.example\",\"accepts\":[]}"), o),
            "empty accepts");
        TEST_CHECK(detect(200, no_headers, "<html><body>free</body></html>").kind == SignalKind::NONE, "plain page");
    }

    // Script tag and init call
    {
        const std::string script = std::string("<script src=\"https://cdn.example/tollgate.js\" ") +
            "data-facilitator-url=\"https://facilitator.example\" data-pay-to=\"" + PAY_TO + "\" " +
            "data-price=\"25000\" data-network=\"eip155:324705682\"></script>";
        Signal s = detect(200, no_headers, script);
        TEST_CHECK(s.kind == SignalKind::INLINE, "script tag detected");
        TEST_CHECK(s.offer.accepts[0].amount == "25000", "price");
        TEST_CHECK(s.offer.accepts[0].asset == USDC, "default asset");
        TEST_CHECK(s.offer.mode == PaymentMode::CLIENT, "default client mode");

        PaymentOffer o;
        const std::string no_brand = std::string("<script src=\"https://cdn.example/paywall.js\" ") +
            "data-facilitator-url=\"https://facilitator.example\" data-pay-to=\"" + PAY_TO + "\" " +
            "data-price=\"25000\" data-network=\"eip155:324705682\"></script>";
        TEST_CHECK(!parse_script_tag(no_brand, o), "script src must name tollgate");

        const std::string zero = std::string("<script src=\"/tollgate.js\" data-facilitator-url=\"https://f.example\" ") +
            "data-pay-to=\"" + PAY_TO + "\" data-price=\"0\" data-network=\"eip155:324705682\"></script>";
        TEST_CHECK(!parse_script_tag(zero, o), "zero price rejected");

        const std::string init = std::string("<script>Tollgate.init({ facilitatorUrl: 'https://facilitator.example', ") +
            "payTo: '" + PAY_TO + "', price: '5000', network: 'eip155:1187947933', mode: 'server', " +
            "paymentUrl: 'https://pub.example/pay' });</script>";
        s = detect(200, no_headers, init);
        TEST_CHECK(s.kind == SignalKind::INLINE, "init call detected");
        TEST_CHECK(s.offer.mode == PaymentMode::SERVER && s.offer.payment_url == "https://pub.example/pay", "init server");
        TEST_CHECK(s.offer.accepts[0].network == "eip155:1187947933", "init network");

        const std::string bad_net = std::string("<script>Tollgate.init({ facilitatorUrl: 'https://f.example', ") +
            "payTo: '" + PAY_TO + "', price: '5000', network: 'solana:mainnet' });</script>";
        TEST_CHECK(!parse_init_call(bad_net, o), "non-EVM network rejected");
    }

    // HTTP 402
    {
        const std::string required = std::string("{\"x402Version\":2,\"resource\":{\"url\":\"https://api.example/data\"},") +
            "\"accepts\":[{\"scheme\":\"exact\",\"network\":\"eip155:324705682\",\"amount\":\"30000\"," +
            "\"asset\":\"" + USDC + "\",\"payTo\":\"" + PAY_TO + "\",\"maxTimeoutSeconds\":120," +
            "\"extra\":{\"name\":\"USDC\",\"version\":\"2\"}}]}";
        std::map<std::string,std::string> headers;
        headers["payment-required"] = base64_encode(required);

        // Even with an inline tag in the body, the 402 status decides
        Signal s = detect(402, headers, meta_page(offer_json("client")));
        TEST_CHECK(s.kind == SignalKind::PROTOCOL_402, "402 wins over inline markup");
        TEST_CHECK(s.offer.mode == PaymentMode::PROTOCOL_402, "402 mode");
        TEST_CHECK(s.offer.accepts.size() == 1 && s.offer.accepts[0].amount == "30000", "402 accepts");
        TEST_CHECK(s.offer.accepts[0].max_timeout_seconds == 120, "maxTimeoutSeconds carried");
        TEST_CHECK(json_string_or(s.offer.accepts[0].extra, "name") == "USDC", "extra carried");
        TEST_CHECK(json_is_object(s.offer.resource), "resource carried");

        // An absurd timeout is not carried, and never overflows
        const std::string huge = std::string("{\"x402Version\":2,\"accepts\":[{\"scheme\":\"exact\",") +
            "\"network\":\"eip155:324705682\",\"amount\":\"30000\",\"asset\":\"" + USDC + "\",\"payTo\":\"" +
            PAY_TO + "\",\"maxTimeoutSeconds\":1e12,\"extra\":{\"name\":\"USDC\",\"version\":\"2\"}}]}";
        std::map<std::string,std::string> huge_headers;
        huge_headers["payment-required"] = base64_encode(huge);
        Signal h = detect(402, huge_headers, "");
        TEST_CHECK(h.kind == SignalKind::PROTOCOL_402 && h.offer.accepts.size() == 1, "402 with huge timeout");
        TEST_CHECK(h.offer.accepts[0].max_timeout_seconds == 300, "out-of-range maxTimeoutSeconds ignored");

        const std::string v1 = std::string("{\"x402Version\":1,\"accepts\":[{\"scheme\":\"exact\",") +
            "\"network\":\"eip155:324705682\",\"maxAmountRequired\":\"7000\",\"asset\":\"" + USDC +
            "\",\"payTo\":\"" + PAY_TO + "\"}]}";
        s = detect(402, no_headers, v1);
        TEST_CHECK(s.kind == SignalKind::PROTOCOL_402 && s.offer.x402_version == 1, "v1 body");
        TEST_CHECK(s.offer.accepts.size() == 1 && s.offer.accepts[0].amount == "7000", "maxAmountRequired");

        s = detect(402, no_headers, "Payment Required");
        TEST_CHECK(s.kind == SignalKind::PROTOCOL_402 && s.offer.accepts.empty(), "unparseable 402 keeps its kind");
    }

    std::printf("test_detector: OK\n");
    return 0;
}
