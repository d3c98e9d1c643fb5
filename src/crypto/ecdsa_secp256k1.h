#pragma once
#include <array>
#include <vector>
#include <cstdint>
#include <string>
namespace tollgate { namespace crypto {
// Thin wrapper over libsecp256k1 with the recovery module.
struct Secp256k1 {
    static bool generate_priv(std::vector<uint8_t>& out32);
    static bool is_valid_priv(const std::vector<uint8_t>& priv);
    // 65 bytes, 0x04 || X || Y
    static bool derive_pub_uncompressed(const std::vector<uint8_t>& priv, std::vector<uint8_t>& out65);
    // r || s || recid (recid in {0,1}); low-S, RFC 6979 nonce
    static bool sign_recoverable(const uint8_t msg32[32], const std::vector<uint8_t>& priv,
                                 std::array<uint8_t,65>& sig);
    static bool recover_pub_uncompressed(const uint8_t msg32[32], const std::array<uint8_t,65>& sig,
                                         std::vector<uint8_t>& out65);
    static std::string name();
};
}} // ns
