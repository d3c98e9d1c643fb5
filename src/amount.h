#pragma once
// Arbitrary-precision non-negative token amounts in smallest units (OpenSSL BIGNUM).
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct bignum_st;

namespace tollgate {

static constexpr int USDC_DECIMALS = 6;

class Amount {
public:
    Amount();
    Amount(const Amount& o);
    Amount(Amount&&) noexcept = default;
    Amount& operator=(const Amount& o);
    Amount& operator=(Amount&&) noexcept = default;
    ~Amount();

    // Plain base-10 digits only. No sign, no decimal point, no whitespace.
    static bool parse(const std::string& digits, Amount& out);

    std::string to_string() const;
    // 32-byte big-endian word; false when the value does not fit in 256 bits.
    bool to_uint256(std::vector<uint8_t>& out32) const;

    Amount operator+(const Amount& o) const;
    Amount& operator+=(const Amount& o);
    int compare(const Amount& o) const;
    bool is_zero() const;

    bool operator<(const Amount& o) const  { return compare(o) < 0; }
    bool operator>(const Amount& o) const  { return compare(o) > 0; }
    bool operator<=(const Amount& o) const { return compare(o) <= 0; }
    bool operator==(const Amount& o) const { return compare(o) == 0; }

private:
    struct BnFree { void operator()(bignum_st* p) const; };
    std::unique_ptr<bignum_st, BnFree> bn_;
};

// "0.01" -> "10000". Extra fraction digits beyond 6 are truncated.
// False on anything but digits with at most one '.'.
bool usdc_to_smallest(const std::string& usdc, Amount& out);
bool usdc_to_smallest(const std::string& usdc, std::string& out);

// "10000" -> "0.01"; trailing zeros stripped but at least two decimals kept.
// Unparseable input is returned unchanged.
std::string smallest_to_usdc(const std::string& smallest);
std::string smallest_to_usdc(const Amount& smallest);

}
