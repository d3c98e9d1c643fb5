#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace tollgate {
// Empty vector on odd length or non-hex characters. Accepts an optional 0x prefix.
std::vector<uint8_t> from_hex(const std::string& hex);
std::string to_hex(const std::vector<uint8_t>& v);
std::string to_hex(const uint8_t* p, size_t n);
// "0x" + lowercase hex
std::string to_hex_0x(const std::vector<uint8_t>& v);

bool is_hex_string(const std::string& s);
// 0x followed by exactly 40 hex digits, any case
bool is_eth_address(const std::string& s);
// 0x followed by exactly 64 hex digits
bool is_private_key_hex(const std::string& s);

std::string to_lower(std::string s);
}
