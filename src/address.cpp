#include "address.h"
#include "hex.h"
#include "crypto/keccak256.h"
#include "crypto/ecdsa_secp256k1.h"

#include <cctype>

namespace tollgate {

std::string encode_eth_address(const std::vector<uint8_t>& id20){
    if(id20.size() != 20) return std::string();
    const std::string lower = to_hex(id20);
    const std::vector<uint8_t> h = keccak256(lower);
    std::string out = "0x";
    for(size_t i = 0; i < lower.size(); ++i){
        char c = lower[i];
        const uint8_t nibble = (i % 2 == 0) ? (h[i/2] >> 4) : (h[i/2] & 0x0f);
        if(c >= 'a' && c <= 'f' && nibble >= 8) c = (char)std::toupper((unsigned char)c);
        out.push_back(c);
    }
    return out;
}

bool decode_eth_address(const std::string& addr, std::vector<uint8_t>& out_id20){
    if(!is_eth_address(addr)) return false;
    out_id20 = from_hex(addr);
    return out_id20.size() == 20;
}

std::string address_from_pubkey(const std::vector<uint8_t>& pub65){
    if(pub65.size() != 65 || pub65[0] != 0x04) return std::string();
    const std::vector<uint8_t> xy(pub65.begin() + 1, pub65.end());
    const std::vector<uint8_t> h = keccak256(xy);
    return encode_eth_address(std::vector<uint8_t>(h.begin() + 12, h.end()));
}

std::string address_from_private_key(const std::vector<uint8_t>& priv32){
    std::vector<uint8_t> pub;
    if(!crypto::Secp256k1::derive_pub_uncompressed(priv32, pub)) return std::string();
    return address_from_pubkey(pub);
}

}
