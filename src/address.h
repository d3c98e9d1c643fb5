#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace tollgate {
// EIP-55 mixed-case checksum form of a 20-byte account id.
std::string encode_eth_address(const std::vector<uint8_t>& id20);
// Accepts any case; fills the 20-byte id.
bool decode_eth_address(const std::string& addr, std::vector<uint8_t>& out_id20);
// Last 20 bytes of keccak256(X || Y) of a 65-byte uncompressed key.
std::string address_from_pubkey(const std::vector<uint8_t>& pub65);
// Empty string when the key is not a valid secp256k1 scalar.
std::string address_from_private_key(const std::vector<uint8_t>& priv32);
}
