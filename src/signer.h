#pragma once
#include "json.h"
#include "signal_detector.h"

#include <cstdint>
#include <string>
#include <vector>

namespace tollgate {

// Every authorization expires this long after signing, whatever the offer asks for.
static constexpr uint64_t AUTHORIZATION_VALIDITY_SECONDS = 300;

struct Eip712Domain {
    std::string name;
    std::string version;
    uint64_t    chain_id{0};
    std::string verifying_contract;
};

// EIP-3009 TransferWithAuthorization message. Integers are decimal strings,
// the nonce is 0x-prefixed 32-byte hex.
struct TransferAuthorization {
    std::string from;
    std::string to;
    std::string value;
    std::string valid_after;
    std::string valid_before;
    std::string nonce;
};

struct SignedAuthorization {
    TransferAuthorization authorization;
    std::string signature;  // 0x || r || s || v, v in {27, 28}
};

std::vector<uint8_t> domain_separator(const Eip712Domain& d);
std::vector<uint8_t> authorization_struct_hash(const TransferAuthorization& a);
// keccak256(0x19 0x01 || domainSeparator || structHash)
std::vector<uint8_t> authorization_digest(const Eip712Domain& d, const TransferAuthorization& a);

// Sign a transfer of `accept.amount` to `accept.pay_to`, valid from 0 until
// now + AUTHORIZATION_VALIDITY_SECONDS, under a fresh random nonce.
// Throws EngineError(INVALID_PRIVATE_KEY) or EngineError(PAYMENT_ERROR).
SignedAuthorization sign_authorization(const std::vector<uint8_t>& priv32,
                                       const Eip712Domain& domain,
                                       const AcceptedPayment& accept);

// Checksummed address of the key that produced `signed_auth`; empty on failure.
std::string recover_authorization_signer(const Eip712Domain& domain, const SignedAuthorization& signed_auth);

JNode requirements_json(const AcceptedPayment& accept, const JNode& extra);
JNode authorization_json(const SignedAuthorization& s);

// x402 v2 envelope: {x402Version, resource, accepted, payload}
JNode payment_payload_json(const std::string& resource_url, const JNode& requirements,
                           const SignedAuthorization& s);
// x402 v1 envelope: {x402Version, scheme, network, payload}
JNode payment_payload_v1_json(const AcceptedPayment& accept, const SignedAuthorization& s);

}
