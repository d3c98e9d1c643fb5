#include "amount.h"
#include "errors.h"

#include <openssl/bn.h>
#include <openssl/crypto.h>

namespace tollgate {

void Amount::BnFree::operator()(bignum_st* p) const {
    BN_free(p);
}

static BIGNUM* checked(BIGNUM* p) {
    if (!p) throw EngineError(ErrorCode::PAYMENT_ERROR, "BIGNUM allocation failed");
    return p;
}

Amount::Amount() : bn_(checked(BN_new())) {
    BN_zero(bn_.get());
}

Amount::Amount(const Amount& o) : bn_(checked(BN_dup(o.bn_.get()))) {}

Amount& Amount::operator=(const Amount& o) {
    if (this != &o) {
        if (!bn_) { bn_.reset(checked(BN_dup(o.bn_.get()))); return *this; }
        if (!BN_copy(bn_.get(), o.bn_.get())) throw EngineError(ErrorCode::PAYMENT_ERROR, "BN_copy failed");
    }
    return *this;
}

Amount::~Amount() = default;

static bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool Amount::parse(const std::string& digits, Amount& out) {
    if (!all_digits(digits)) return false;
    BIGNUM* p = out.bn_.get();
    if (BN_dec2bn(&p, digits.c_str()) == 0) return false;
    return true;
}

std::string Amount::to_string() const {
    char* s = BN_bn2dec(bn_.get());
    if (!s) throw EngineError(ErrorCode::PAYMENT_ERROR, "BN_bn2dec failed");
    std::string out(s);
    OPENSSL_free(s);
    return out;
}

bool Amount::to_uint256(std::vector<uint8_t>& out32) const {
    if (BN_num_bytes(bn_.get()) > 32) return false;
    out32.assign(32, 0);
    return BN_bn2binpad(bn_.get(), out32.data(), 32) == 32;
}

Amount Amount::operator+(const Amount& o) const {
    Amount r;
    if (!BN_add(r.bn_.get(), bn_.get(), o.bn_.get())) throw EngineError(ErrorCode::PAYMENT_ERROR, "BN_add failed");
    return r;
}

Amount& Amount::operator+=(const Amount& o) {
    if (!BN_add(bn_.get(), bn_.get(), o.bn_.get())) throw EngineError(ErrorCode::PAYMENT_ERROR, "BN_add failed");
    return *this;
}

int Amount::compare(const Amount& o) const {
    return BN_cmp(bn_.get(), o.bn_.get());
}

bool Amount::is_zero() const {
    return BN_is_zero(bn_.get());
}

bool usdc_to_smallest(const std::string& usdc, std::string& out) {
    const size_t dot = usdc.find('.');
    std::string whole = dot == std::string::npos ? usdc : usdc.substr(0, dot);
    std::string frac = dot == std::string::npos ? std::string() : usdc.substr(dot + 1);
    if (whole.empty()) whole = "0";
    if (!all_digits(whole)) return false;
    if (!frac.empty() && !all_digits(frac)) return false;
    if (dot != std::string::npos && frac.empty() && usdc.size() == 1) return false;

    frac.resize(USDC_DECIMALS, '0');  // pads or truncates
    std::string digits = whole + frac;
    size_t nz = digits.find_first_not_of('0');
    out = nz == std::string::npos ? "0" : digits.substr(nz);
    return true;
}

bool usdc_to_smallest(const std::string& usdc, Amount& out) {
    std::string digits;
    if (!usdc_to_smallest(usdc, digits)) return false;
    return Amount::parse(digits, out);
}

std::string smallest_to_usdc(const Amount& smallest) {
    std::string s = smallest.to_string();
    if (s.size() <= (size_t)USDC_DECIMALS) s.insert(0, (size_t)USDC_DECIMALS + 1 - s.size(), '0');
    const std::string whole = s.substr(0, s.size() - USDC_DECIMALS);
    std::string frac = s.substr(s.size() - USDC_DECIMALS);
    while (frac.size() > 2 && frac.back() == '0') frac.pop_back();
    return whole + "." + frac;
}

std::string smallest_to_usdc(const std::string& smallest) {
    Amount a;
    if (!Amount::parse(smallest, a)) return smallest;
    return smallest_to_usdc(a);
}

}
