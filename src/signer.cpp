#include "signer.h"
#include "address.h"
#include "amount.h"
#include "errors.h"
#include "hex.h"
#include "util.h"
#include "crypto/ecdsa_secp256k1.h"
#include "crypto/keccak256.h"
#include "crypto/secure_random.h"

#include <array>

namespace tollgate {

static const char* DOMAIN_TYPE =
    "EIP712Domain(string name,string version,uint256 chainId,address verifyingContract)";
static const char* TRANSFER_TYPE =
    "TransferWithAuthorization(address from,address to,uint256 value,uint256 validAfter,"
    "uint256 validBefore,bytes32 nonce)";

static void put_word(std::vector<uint8_t>& buf, const std::vector<uint8_t>& w32) {
    buf.insert(buf.end(), w32.begin(), w32.end());
}

static std::vector<uint8_t> word_uint(const std::string& decimal) {
    Amount a;
    std::vector<uint8_t> out;
    if (!Amount::parse(decimal, a) || !a.to_uint256(out)) {
        throw EngineError(ErrorCode::PAYMENT_ERROR, "not a uint256: " + decimal);
    }
    return out;
}

static std::vector<uint8_t> word_address(const std::string& addr) {
    std::vector<uint8_t> id;
    if (!decode_eth_address(addr, id)) throw EngineError(ErrorCode::PAYMENT_ERROR, "bad address: " + addr);
    std::vector<uint8_t> out(12, 0);
    out.insert(out.end(), id.begin(), id.end());
    return out;
}

static std::vector<uint8_t> word_bytes32(const std::string& hex) {
    std::vector<uint8_t> out = from_hex(hex);
    if (out.size() != 32) throw EngineError(ErrorCode::PAYMENT_ERROR, "bad bytes32: " + hex);
    return out;
}

std::vector<uint8_t> domain_separator(const Eip712Domain& d) {
    std::vector<uint8_t> buf;
    buf.reserve(32 * 5);
    put_word(buf, keccak256(std::string(DOMAIN_TYPE)));
    put_word(buf, keccak256(d.name));
    put_word(buf, keccak256(d.version));
    put_word(buf, word_uint(std::to_string(d.chain_id)));
    put_word(buf, word_address(d.verifying_contract));
    return keccak256(buf);
}

std::vector<uint8_t> authorization_struct_hash(const TransferAuthorization& a) {
    std::vector<uint8_t> buf;
    buf.reserve(32 * 7);
    put_word(buf, keccak256(std::string(TRANSFER_TYPE)));
    put_word(buf, word_address(a.from));
    put_word(buf, word_address(a.to));
    put_word(buf, word_uint(a.value));
    put_word(buf, word_uint(a.valid_after));
    put_word(buf, word_uint(a.valid_before));
    put_word(buf, word_bytes32(a.nonce));
    return keccak256(buf);
}

std::vector<uint8_t> authorization_digest(const Eip712Domain& d, const TransferAuthorization& a) {
    std::vector<uint8_t> buf{0x19, 0x01};
    put_word(buf, domain_separator(d));
    put_word(buf, authorization_struct_hash(a));
    return keccak256(buf);
}

SignedAuthorization sign_authorization(const std::vector<uint8_t>& priv32,
                                       const Eip712Domain& domain,
                                       const AcceptedPayment& accept) {
    const std::string from = address_from_private_key(priv32);
    if (from.empty()) throw EngineError(ErrorCode::INVALID_PRIVATE_KEY, "signing key is not a valid secp256k1 scalar");
    if (!is_eth_address(accept.pay_to)) throw EngineError(ErrorCode::PAYMENT_ERROR, "bad payTo: " + accept.pay_to);

    SignedAuthorization out;
    TransferAuthorization& a = out.authorization;
    a.from = from;
    a.to = accept.pay_to;
    a.value = accept.amount;
    a.valid_after = "0";
    a.valid_before = std::to_string(now() + AUTHORIZATION_VALIDITY_SECONDS);
    a.nonce = to_hex_0x(random_bytes(32));

    const std::vector<uint8_t> digest = authorization_digest(domain, a);
    std::array<uint8_t,65> sig{};
    if (!crypto::Secp256k1::sign_recoverable(digest.data(), priv32, sig)) {
        throw EngineError(ErrorCode::PAYMENT_ERROR, "secp256k1 signing failed");
    }
    sig[64] = static_cast<uint8_t>(27 + sig[64]);
    out.signature = "0x" + to_hex(sig.data(), sig.size());
    return out;
}

std::string recover_authorization_signer(const Eip712Domain& domain, const SignedAuthorization& signed_auth) {
    const std::vector<uint8_t> raw = from_hex(signed_auth.signature);
    if (raw.size() != 65 || raw[64] < 27 || raw[64] > 28) return std::string();
    std::array<uint8_t,65> sig{};
    std::copy(raw.begin(), raw.end(), sig.begin());
    sig[64] = static_cast<uint8_t>(sig[64] - 27);

    std::vector<uint8_t> digest;
    try {
        digest = authorization_digest(domain, signed_auth.authorization);
    } catch (const EngineError&) {
        return std::string();
    }
    std::vector<uint8_t> pub;
    if (!crypto::Secp256k1::recover_pub_uncompressed(digest.data(), sig, pub)) return std::string();
    return address_from_pubkey(pub);
}

JNode requirements_json(const AcceptedPayment& accept, const JNode& extra) {
    JObject o;
    o["scheme"] = jstr(accept.scheme);
    o["network"] = jstr(accept.network);
    o["asset"] = jstr(accept.asset);
    o["amount"] = jstr(accept.amount);
    o["payTo"] = jstr(accept.pay_to);
    o["maxTimeoutSeconds"] = jnum(accept.max_timeout_seconds);
    o["extra"] = json_is_object(extra) ? extra : jobj();
    return jobj(std::move(o));
}

JNode authorization_json(const SignedAuthorization& s) {
    const TransferAuthorization& a = s.authorization;
    JObject auth;
    auth["from"] = jstr(a.from);
    auth["to"] = jstr(a.to);
    auth["value"] = jstr(a.value);
    auth["validAfter"] = jstr(a.valid_after);
    auth["validBefore"] = jstr(a.valid_before);
    auth["nonce"] = jstr(a.nonce);
    JObject payload;
    payload["signature"] = jstr(s.signature);
    payload["authorization"] = jobj(std::move(auth));
    return jobj(std::move(payload));
}

JNode payment_payload_json(const std::string& resource_url, const JNode& requirements,
                           const SignedAuthorization& s) {
    JObject resource;
    resource["url"] = jstr(resource_url);
    resource["description"] = jstr("");
    resource["mimeType"] = jstr("");
    JObject o;
    o["x402Version"] = jnum(2);
    o["resource"] = jobj(std::move(resource));
    o["accepted"] = requirements;
    o["payload"] = authorization_json(s);
    return jobj(std::move(o));
}

JNode payment_payload_v1_json(const AcceptedPayment& accept, const SignedAuthorization& s) {
    JObject o;
    o["x402Version"] = jnum(1);
    o["scheme"] = jstr(accept.scheme);
    o["network"] = jstr(accept.network);
    o["payload"] = authorization_json(s);
    return jobj(std::move(o));
}

}
