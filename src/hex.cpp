#include "hex.h"
#include <cctype>
#include <cstdint>
#include <string>

namespace tollgate {

static inline int unhex_nibble(char c) {
    if (c >= '0' && c <= '9') return static_cast<int>(c - '0');
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return static_cast<int>(10 + (c - 'a'));
    return -1;
}

static inline bool has_0x(const std::string& h) {
    return h.size() >= 2 && h[0] == '0' && (h[1] == 'x' || h[1] == 'X');
}

std::vector<uint8_t> from_hex(const std::string& in) {
    const std::string h = has_0x(in) ? in.substr(2) : in;
    const size_t n = h.size();
    if (n % 2 != 0) return {};
    std::vector<uint8_t> out(n / 2);
    for (size_t i = 0, j = 0; i < n; i += 2, ++j) {
        const int hi = unhex_nibble(h[i]);
        const int lo = unhex_nibble(h[i + 1]);
        if (hi < 0 || lo < 0) return {};
        out[j] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
}

std::string to_hex(const uint8_t* p, size_t n) {
    static constexpr char LUT[] = "0123456789abcdef";
    std::string out;
    out.resize(n * 2);
    for (size_t i = 0; i < n; ++i) {
        out[2 * i]     = LUT[p[i] >> 4];
        out[2 * i + 1] = LUT[p[i] & 0x0F];
    }
    return out;
}

std::string to_hex(const std::vector<uint8_t>& v) {
    return to_hex(v.data(), v.size());
}

std::string to_hex_0x(const std::vector<uint8_t>& v) {
    return "0x" + to_hex(v);
}

bool is_hex_string(const std::string& s) {
    for (char c : s) {
        if (unhex_nibble(c) < 0) return false;
    }
    return true;
}

static bool is_prefixed_hex_of_len(const std::string& s, size_t digits) {
    return s.size() == digits + 2 && s[0] == '0' && s[1] == 'x' && is_hex_string(s.substr(2));
}

bool is_eth_address(const std::string& s) {
    return is_prefixed_hex_of_len(s, 40);
}

bool is_private_key_hex(const std::string& s) {
    return is_prefixed_hex_of_len(s, 64);
}

std::string to_lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

} // namespace tollgate
