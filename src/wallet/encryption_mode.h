#pragma once
#include "crypto/key_engine.h"

#include <memory>
#include <string>
#include <vector>

namespace tollgate {

static constexpr const char* WALLET_KEY_ENV = "TOLLGATE_WALLET_KEY";
static constexpr const char* MACHINE_BOUND_TAG = "tollgate-machine-bound-v1";
static constexpr size_t MIN_PASSWORD_LENGTH = 8;

enum class EncryptionModeName { MACHINE_BOUND, PASSWORD, ENV_INJECTED };

const char* encryption_mode_to_string(EncryptionModeName m);
bool encryption_mode_from_string(const std::string& s, EncryptionModeName& out);
// Empty tag (legacy record) means machine-bound. Throws EngineError(UNKNOWN_ENCRYPTION_MODE).
EncryptionModeName detect_encryption_mode(const std::string& tag);

// Key-derivation backends. They differ only in where the KDF input comes from;
// sealing and opening go through the shared AES-256-GCM engine.
class EncryptionBackend {
public:
    virtual ~EncryptionBackend() = default;

    virtual EncryptionModeName mode() const = 0;
    virtual SymmetricKey derive_key(const std::vector<uint8_t>& salt) const = 0;

    virtual SealedData encrypt(const std::vector<uint8_t>& plaintext, const SymmetricKey& key) const;
    virtual std::vector<uint8_t> decrypt(const SealedData& sealed, const SymmetricKey& key) const;
};

// "<hostname>:<uid>:tollgate-machine-bound-v1"
std::string machine_identity();

class MachineBoundBackend : public EncryptionBackend {
public:
    EncryptionModeName mode() const override { return EncryptionModeName::MACHINE_BOUND; }
    SymmetricKey derive_key(const std::vector<uint8_t>& salt) const override;
};

class PasswordBackend : public EncryptionBackend {
public:
    explicit PasswordBackend(std::string password);
    ~PasswordBackend() override;

    EncryptionModeName mode() const override { return EncryptionModeName::PASSWORD; }
    SymmetricKey derive_key(const std::vector<uint8_t>& salt) const override;

private:
    std::string password_;
};

class EnvInjectedBackend : public EncryptionBackend {
public:
    EncryptionModeName mode() const override { return EncryptionModeName::ENV_INJECTED; }
    // Reads TOLLGATE_WALLET_KEY on every call.
    SymmetricKey derive_key(const std::vector<uint8_t>& salt) const override;
};

// `password` is used only by the password backend.
std::unique_ptr<EncryptionBackend> make_backend(EncryptionModeName mode, const std::string& password = "");

// Strict base64 of exactly 32 bytes, no whitespace. Throws EngineError(DERIVE_KEY_FAILED).
std::vector<uint8_t> decode_key_material(const std::string& encoded);

// At least 8 characters from at least two of {lower, upper, digit, symbol}.
bool check_password_strength(const std::string& password, std::string& reason);

}
