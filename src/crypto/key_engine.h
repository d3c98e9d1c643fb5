#pragma once
//
// key_engine.h: PBKDF2-HMAC-SHA256 key stretching and AES-256-GCM sealing.
// Shared by every wallet encryption backend.
//
#include <cstdint>
#include <string>
#include <vector>

namespace tollgate {

static constexpr int    KDF_ITERATIONS = 600000;
static constexpr size_t KDF_SALT_LEN   = 32;
static constexpr size_t AEAD_KEY_LEN   = 32;
static constexpr size_t AEAD_IV_LEN    = 12;  // AES-GCM standard 96-bit IV
static constexpr size_t AEAD_TAG_LEN   = 16;

// Derived AES key. Bytes are wiped on destruction.
struct SymmetricKey {
    std::vector<uint8_t> bytes;

    SymmetricKey() = default;
    SymmetricKey(const SymmetricKey&) = default;
    SymmetricKey(SymmetricKey&&) = default;
    SymmetricKey& operator=(const SymmetricKey&) = default;
    SymmetricKey& operator=(SymmetricKey&&) = default;
    ~SymmetricKey();
};

struct SealedData {
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> iv;   // AEAD_IV_LEN
    std::vector<uint8_t> tag;  // AEAD_TAG_LEN
};

// Throws EngineError(DERIVE_KEY_FAILED) on a bad salt, empty password or KDF failure.
SymmetricKey derive_key(const std::vector<uint8_t>& salt, const std::string& password);
SymmetricKey derive_key(const std::vector<uint8_t>& salt, const std::vector<uint8_t>& raw_input);

// Fresh random IV per call. Throws EngineError(ENCRYPTION_FAILED).
SealedData aead_encrypt(const std::vector<uint8_t>& plaintext, const SymmetricKey& key);

// Throws EngineError(DECRYPT_FAILED) on any authentication failure; never returns partial output.
std::vector<uint8_t> aead_decrypt(const SealedData& sealed, const SymmetricKey& key);

}
