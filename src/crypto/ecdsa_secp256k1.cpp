// src/crypto/ecdsa_secp256k1.cpp
#include "crypto/ecdsa_secp256k1.h"
#include "crypto/secure_random.h"

#include <mutex>
#include <cstring>
#include <secp256k1.h>
#include <secp256k1_recovery.h>

namespace tollgate { namespace crypto {

static secp256k1_context* g_ctx = nullptr;
static std::once_flag g_once;

static void init_ctx() {
    std::call_once(g_once, []{
        g_ctx = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
        uint8_t seed[32];
        if (secure_random(seed, sizeof(seed))) {
            // Blinding only; signing stays correct without it
            (void)secp256k1_context_randomize(g_ctx, seed);
        }
        secure_wipe(seed, sizeof(seed));
    });
}

bool Secp256k1::is_valid_priv(const std::vector<uint8_t>& sk) {
    init_ctx();
    return sk.size() == 32 && secp256k1_ec_seckey_verify(g_ctx, sk.data()) == 1;
}

bool Secp256k1::generate_priv(std::vector<uint8_t>& out32) {
    init_ctx();
    out32.resize(32);
    do {
        if (!secure_random(out32.data(), 32)) return false;
    } while (!is_valid_priv(out32));
    return true;
}

bool Secp256k1::derive_pub_uncompressed(const std::vector<uint8_t>& priv, std::vector<uint8_t>& out65) {
    init_ctx();
    if (!is_valid_priv(priv)) return false;

    secp256k1_pubkey pk;
    if (secp256k1_ec_pubkey_create(g_ctx, &pk, priv.data()) != 1) return false;

    size_t outlen = 65;
    out65.resize(65);
    if (secp256k1_ec_pubkey_serialize(g_ctx, out65.data(), &outlen, &pk, SECP256K1_EC_UNCOMPRESSED) != 1) return false;
    return outlen == 65;
}

bool Secp256k1::sign_recoverable(const uint8_t msg32[32], const std::vector<uint8_t>& priv,
                                 std::array<uint8_t,65>& sig) {
    init_ctx();
    if (!is_valid_priv(priv)) return false;

    // secp256k1_ecdsa_sign_recoverable always produces low-S
    secp256k1_ecdsa_recoverable_signature rsig;
    if (secp256k1_ecdsa_sign_recoverable(g_ctx, &rsig, msg32, priv.data(), nullptr, nullptr) != 1) return false;

    int recid = 0;
    if (secp256k1_ecdsa_recoverable_signature_serialize_compact(g_ctx, sig.data(), &recid, &rsig) != 1) return false;
    sig[64] = static_cast<uint8_t>(recid);
    return true;
}

bool Secp256k1::recover_pub_uncompressed(const uint8_t msg32[32], const std::array<uint8_t,65>& sig,
                                         std::vector<uint8_t>& out65) {
    init_ctx();
    const int recid = sig[64];
    if (recid < 0 || recid > 3) return false;

    secp256k1_ecdsa_recoverable_signature rsig;
    if (secp256k1_ecdsa_recoverable_signature_parse_compact(g_ctx, &rsig, sig.data(), recid) != 1) return false;

    secp256k1_pubkey pk;
    if (secp256k1_ecdsa_recover(g_ctx, &pk, &rsig, msg32) != 1) return false;

    size_t outlen = 65;
    out65.resize(65);
    if (secp256k1_ec_pubkey_serialize(g_ctx, out65.data(), &outlen, &pk, SECP256K1_EC_UNCOMPRESSED) != 1) return false;
    return outlen == 65;
}

std::string Secp256k1::name() {
    return "libsecp256k1";
}

}}
