#include "signal_detector.h"
#include "base64.h"
#include "hex.h"
#include "log.h"
#include "networks.h"
#include "url.h"

#include <regex>

namespace tollgate {

static constexpr const char* META_NAME = "x402-payment-required";
static constexpr const char* INIT_MARKER = "Tollgate.init(";
static constexpr size_t INIT_WINDOW = 2048;
// Upper bound for the maxTimeoutSeconds echoed back in requirements.
static constexpr double MAX_TIMEOUT_SECONDS_LIMIT = 86400;

const char* payment_mode_to_string(PaymentMode m) {
    switch (m) {
        case PaymentMode::CLIENT:       return "client";
        case PaymentMode::SERVER:       return "server";
        case PaymentMode::PROTOCOL_402: return "402";
    }
    return "client";
}

static bool is_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) if (c < '0' || c > '9') return false;
    return true;
}

static bool is_caip2_evm(const std::string& s) {
    uint64_t id = 0;
    return parse_chain_id(s, id);
}

static bool decode_b64_json(const std::string& b64, JNode& out) {
    std::string raw;
    if (!base64_decode(b64, raw)) return false;
    return json_parse(raw, out) && json_is_object(out);
}

// ---- meta tag ---------------------------------------------------------------

bool parse_meta_tag(const std::string& html, PaymentOffer& out) {
    static const std::regex meta_re(
        std::string("<meta\\s+name=[\"']") + META_NAME + "[\"']\\s+content=[\"']([^\"']+)[\"']",
        std::regex::ECMAScript | std::regex::icase);
    std::smatch m;
    if (!std::regex_search(html, m, meta_re)) return false;

    JNode doc;
    if (!decode_b64_json(m[1].str(), doc)) return false;

    double version = 0;
    if (!json_get_number(doc, "x402Version", version) || version != 2) return false;

    std::string mode;
    if (!json_get_string(doc, "mode", mode) || (mode != "client" && mode != "server")) return false;

    std::string facilitator;
    if (!json_get_string(doc, "facilitatorUrl", facilitator) || facilitator.empty()) return false;

    const JNode* site_key = json_get(doc, "siteKey");
    if (site_key && !json_is_string(*site_key)) return false;
    const JNode* payment_url = json_get(doc, "paymentUrl");
    if (payment_url && !json_is_string(*payment_url)) return false;

    const JNode* accepts = json_get(doc, "accepts");
    if (!accepts || !json_is_array(*accepts)) return false;
    const JArray& arr = std::get<JArray>(accepts->v);
    if (arr.empty()) return false;

    // The first entry must be well formed; later malformed entries are skipped.
    std::string tmp;
    const JNode& first = arr[0];
    if (!json_get_string(first, "scheme", tmp) || !json_get_string(first, "network", tmp) ||
        !json_get_string(first, "amount", tmp) || !json_get_string(first, "asset", tmp) ||
        !json_get_string(first, "payTo", tmp)) {
        return false;
    }

    PaymentOffer offer;
    for (const JNode& e : arr) {
        AcceptedPayment a;
        if (!json_get_string(e, "scheme", a.scheme) || !json_get_string(e, "network", a.network) ||
            !json_get_string(e, "amount", a.amount) || !json_get_string(e, "asset", a.asset) ||
            !is_eth_address(a.asset) || !json_get_string(e, "payTo", a.pay_to)) {
            continue;
        }
        offer.accepts.push_back(std::move(a));
    }
    if (offer.accepts.empty()) return false;

    static const std::regex optimistic_re(
        "<meta[^>]*data-optimistic=[\"']([^\"']+)[\"'][^>]*>",
        std::regex::ECMAScript | std::regex::icase);
    std::smatch om;
    offer.optimistic = !(std::regex_search(html, om, optimistic_re) && om[1].str() == "false");

    offer.x402_version = 2;
    offer.mode = mode == "server" ? PaymentMode::SERVER : PaymentMode::CLIENT;
    offer.facilitator_url = facilitator;
    if (site_key) offer.site_key = std::get<std::string>(site_key->v);
    if (payment_url) offer.payment_url = std::get<std::string>(payment_url->v);
    out = std::move(offer);
    return true;
}

// ---- script tag and init call -----------------------------------------------

namespace {

struct RawConfig {
    std::string facilitator_url, pay_to, price, network;
    std::string mode, asset, payment_url, site_key, optimistic;
};

}

// Shared validation for the two attribute-style sources.
static bool build_offer(const RawConfig& c, PaymentOffer& out) {
    Url u;
    std::string err;
    if (!parse_url(c.facilitator_url, u, err)) return false;
    if (!is_eth_address(c.pay_to)) return false;
    if (!is_digits(c.price) || c.price.find_first_not_of('0') == std::string::npos) return false;
    if (!is_caip2_evm(c.network)) return false;

    const std::string mode = c.mode.empty() ? "client" : c.mode;
    if (mode != "client" && mode != "server") return false;

    const std::string asset = c.asset.empty() ? DEFAULT_ASSET : c.asset;
    if (!is_eth_address(asset)) return false;

    if (!c.payment_url.empty() && !parse_url(c.payment_url, u, err)) return false;

    PaymentOffer offer;
    offer.x402_version = 2;
    offer.mode = mode == "server" ? PaymentMode::SERVER : PaymentMode::CLIENT;
    offer.facilitator_url = c.facilitator_url;
    offer.site_key = c.site_key;
    offer.payment_url = c.payment_url;
    offer.optimistic = c.optimistic != "false";
    AcceptedPayment a;
    a.network = c.network;
    a.amount = c.price;
    a.asset = asset;
    a.pay_to = c.pay_to;
    offer.accepts.push_back(std::move(a));
    out = std::move(offer);
    return true;
}

static std::string data_attr(const std::string& tag, const std::string& name) {
    const std::regex re("data-" + name + "\\s*=\\s*[\"']([^\"']+)[\"']",
                        std::regex::ECMAScript | std::regex::icase);
    std::smatch m;
    return std::regex_search(tag, m, re) ? m[1].str() : std::string();
}

bool parse_script_tag(const std::string& html, PaymentOffer& out) {
    static const std::regex script_re(
        "<script\\s+([^>]*src=[\"'][^\"']*tollgate[^\"']*[\"'][^>]*)>",
        std::regex::ECMAScript | std::regex::icase);
    for (auto it = std::sregex_iterator(html.begin(), html.end(), script_re);
         it != std::sregex_iterator(); ++it) {
        const std::string tag = (*it)[1].str();
        RawConfig c;
        c.facilitator_url = data_attr(tag, "facilitator-url");
        c.pay_to = data_attr(tag, "pay-to");
        c.price = data_attr(tag, "price");
        c.network = data_attr(tag, "network");
        if (c.facilitator_url.empty() || c.pay_to.empty() || c.price.empty() || c.network.empty()) continue;
        c.mode = data_attr(tag, "mode");
        c.asset = data_attr(tag, "asset");
        c.payment_url = data_attr(tag, "payment-url");
        c.site_key = data_attr(tag, "site-key");
        c.optimistic = data_attr(tag, "optimistic");
        if (build_offer(c, out)) return true;
    }
    return false;
}

static std::string string_prop(const std::string& window, const std::string& name) {
    const std::regex re(name + "\\s*:\\s*['\"]([^'\"]+)['\"]");
    std::smatch m;
    return std::regex_search(window, m, re) ? m[1].str() : std::string();
}

bool parse_init_call(const std::string& html, PaymentOffer& out) {
    const std::string marker = INIT_MARKER;
    size_t from = 0;
    for (;;) {
        const size_t idx = html.find(marker, from);
        if (idx == std::string::npos) return false;
        const std::string window = html.substr(idx + marker.size(), INIT_WINDOW);

        RawConfig c;
        c.facilitator_url = string_prop(window, "facilitatorUrl");
        c.pay_to = string_prop(window, "payTo");
        c.price = string_prop(window, "price");
        c.network = string_prop(window, "network");
        if (!c.facilitator_url.empty() && !c.pay_to.empty() && !c.price.empty() && !c.network.empty()) {
            c.mode = string_prop(window, "mode");
            c.asset = string_prop(window, "asset");
            c.payment_url = string_prop(window, "paymentUrl");
            c.site_key = string_prop(window, "siteKey");
            c.optimistic = string_prop(window, "optimistic");
            if (build_offer(c, out)) return true;
        }
        from = idx + marker.size();
    }
}

// ---- HTTP 402 ---------------------------------------------------------------

static bool parse_requirements(const JNode& e, AcceptedPayment& a) {
    if (!json_get_string(e, "scheme", a.scheme)) return false;
    if (!json_get_string(e, "network", a.network)) return false;
    // v1 names the price maxAmountRequired
    if (!json_get_string(e, "amount", a.amount) && !json_get_string(e, "maxAmountRequired", a.amount)) return false;
    if (!is_digits(a.amount)) return false;
    if (!json_get_string(e, "asset", a.asset) || !is_eth_address(a.asset)) return false;
    if (!json_get_string(e, "payTo", a.pay_to) || !is_eth_address(a.pay_to)) return false;
    double t = 0;
    if (json_get_number(e, "maxTimeoutSeconds", t)) {
        if (t >= 1 && t <= MAX_TIMEOUT_SECONDS_LIMIT) a.max_timeout_seconds = static_cast<int>(t);
        else log_warn(LogCategory::ENGINE, "ignoring out-of-range maxTimeoutSeconds in 402 requirements");
    }
    const JNode* extra = json_get(e, "extra");
    a.extra = (extra && json_is_object(*extra)) ? *extra : jobj();
    return true;
}

static bool offer_from_document(const JNode& doc, PaymentOffer& out) {
    double version = 0;
    if (!json_get_number(doc, "x402Version", version)) return false;
    const JNode* accepts = json_get(doc, "accepts");
    if (!accepts || !json_is_array(*accepts)) return false;

    PaymentOffer offer;
    offer.mode = PaymentMode::PROTOCOL_402;
    offer.x402_version = static_cast<int>(version);
    offer.optimistic = false;
    for (const JNode& e : std::get<JArray>(accepts->v)) {
        AcceptedPayment a;
        if (parse_requirements(e, a)) offer.accepts.push_back(std::move(a));
    }
    const JNode* resource = json_get(doc, "resource");
    if (resource && json_is_object(*resource)) offer.resource = *resource;
    out = std::move(offer);
    return true;
}

bool parse_payment_required(const std::map<std::string,std::string>& headers,
                            const std::string& body, PaymentOffer& out) {
    auto it = headers.find("payment-required");
    if (it != headers.end() && !it->second.empty()) {
        JNode doc;
        if (decode_b64_json(it->second, doc) && offer_from_document(doc, out)) return true;
        TOLLGATE_LOG_DEBUG(LogCategory::ENGINE, "unparseable PAYMENT-REQUIRED header");
    }

    JNode doc;
    double version = 0;
    if (json_parse(body, doc) && json_get_number(doc, "x402Version", version) && version == 1) {
        return offer_from_document(doc, out);
    }
    return false;
}

Signal detect(int status, const std::map<std::string,std::string>& headers, const std::string& body) {
    Signal sig;
    if (status == 402) {
        sig.kind = SignalKind::PROTOCOL_402;
        if (!parse_payment_required(headers, body, sig.offer)) {
            sig.offer = PaymentOffer{};
            sig.offer.mode = PaymentMode::PROTOCOL_402;
        }
        return sig;
    }

    if (parse_meta_tag(body, sig.offer) || parse_script_tag(body, sig.offer) ||
        parse_init_call(body, sig.offer)) {
        sig.kind = SignalKind::INLINE;
        return sig;
    }
    sig.offer = PaymentOffer{};
    return sig;
}

}
