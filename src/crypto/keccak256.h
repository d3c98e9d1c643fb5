#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace tollgate {

// Original Keccak padding (0x01), as used by Ethereum. Not FIPS-202 SHA3-256.
struct Keccak256 {
    void init();
    void update(const uint8_t* data, size_t len);
    void final(uint8_t out[32]);

    uint64_t st[25];
    uint8_t  buf[136];  // rate bytes
    size_t   idx;
};

std::vector<uint8_t> keccak256(const std::vector<uint8_t>& data);
std::vector<uint8_t> keccak256(const std::string& data);

}
