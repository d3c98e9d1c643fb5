#include "wallet/encryption_mode.h"
#include "base64.h"
#include "errors.h"
#include "crypto/secure_random.h"

#include <cctype>
#include <cstdlib>
#include <memory>

#include <unistd.h>

namespace tollgate {

const char* encryption_mode_to_string(EncryptionModeName m) {
    switch (m) {
        case EncryptionModeName::MACHINE_BOUND: return "machine-bound";
        case EncryptionModeName::PASSWORD:      return "password";
        case EncryptionModeName::ENV_INJECTED:  return "env-injected";
    }
    return "machine-bound";
}

bool encryption_mode_from_string(const std::string& s, EncryptionModeName& out) {
    if (s == "machine-bound") out = EncryptionModeName::MACHINE_BOUND;
    else if (s == "password") out = EncryptionModeName::PASSWORD;
    else if (s == "env-injected") out = EncryptionModeName::ENV_INJECTED;
    else return false;
    return true;
}

EncryptionModeName detect_encryption_mode(const std::string& tag) {
    if (tag.empty()) return EncryptionModeName::MACHINE_BOUND;
    EncryptionModeName m;
    if (!encryption_mode_from_string(tag, m)) {
        throw EngineError(ErrorCode::UNKNOWN_ENCRYPTION_MODE,
                          "Unknown encryption mode \"" + tag + "\". Valid modes: password, env-injected, machine-bound");
    }
    return m;
}

SealedData EncryptionBackend::encrypt(const std::vector<uint8_t>& plaintext, const SymmetricKey& key) const {
    return aead_encrypt(plaintext, key);
}

std::vector<uint8_t> EncryptionBackend::decrypt(const SealedData& sealed, const SymmetricKey& key) const {
    return aead_decrypt(sealed, key);
}

std::string machine_identity() {
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) != 0) host[0] = '\0';
    return std::string(host) + ":" + std::to_string(static_cast<unsigned long>(getuid())) + ":" + MACHINE_BOUND_TAG;
}

SymmetricKey MachineBoundBackend::derive_key(const std::vector<uint8_t>& salt) const {
    return tollgate::derive_key(salt, machine_identity());
}

PasswordBackend::PasswordBackend(std::string password) : password_(std::move(password)) {}

PasswordBackend::~PasswordBackend() {
    secure_wipe(password_);
}

SymmetricKey PasswordBackend::derive_key(const std::vector<uint8_t>& salt) const {
    return tollgate::derive_key(salt, password_);
}

std::vector<uint8_t> decode_key_material(const std::string& encoded) {
    if (encoded.empty()) {
        throw EngineError(ErrorCode::DERIVE_KEY_FAILED, std::string(WALLET_KEY_ENV) + " is empty");
    }
    for (char c : encoded) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            throw EngineError(ErrorCode::DERIVE_KEY_FAILED,
                              std::string(WALLET_KEY_ENV) + " contains whitespace");
        }
    }
    std::vector<uint8_t> out;
    if (!base64_decode(encoded, out)) {
        throw EngineError(ErrorCode::DERIVE_KEY_FAILED, std::string(WALLET_KEY_ENV) + " is not valid base64");
    }
    if (out.size() != 32) {
        const size_t got = out.size();
        secure_wipe(out);
        throw EngineError(ErrorCode::DERIVE_KEY_FAILED,
                          std::string(WALLET_KEY_ENV) + " must decode to exactly 32 bytes, got " + std::to_string(got));
    }
    return out;
}

SymmetricKey EnvInjectedBackend::derive_key(const std::vector<uint8_t>& salt) const {
    const char* v = std::getenv(WALLET_KEY_ENV);
    if (!v || !*v) {
        throw EngineError(ErrorCode::DERIVE_KEY_FAILED,
                          std::string("environment variable ") + WALLET_KEY_ENV + " is not set; "
                          "expected a base64-encoded 32-byte key");
    }
    std::vector<uint8_t> material = decode_key_material(v);
    SymmetricKey k = tollgate::derive_key(salt, material);
    secure_wipe(material);
    return k;
}

std::unique_ptr<EncryptionBackend> make_backend(EncryptionModeName mode, const std::string& password) {
    switch (mode) {
        case EncryptionModeName::MACHINE_BOUND: return std::make_unique<MachineBoundBackend>();
        case EncryptionModeName::PASSWORD:      return std::make_unique<PasswordBackend>(password);
        case EncryptionModeName::ENV_INJECTED:  return std::make_unique<EnvInjectedBackend>();
    }
    throw EngineError(ErrorCode::UNKNOWN_ENCRYPTION_MODE, "unsupported encryption mode");
}

bool check_password_strength(const std::string& password, std::string& reason) {
    if (password.size() < MIN_PASSWORD_LENGTH) {
        reason = "Password must be at least " + std::to_string(MIN_PASSWORD_LENGTH) + " characters";
        return false;
    }
    bool lower = false, upper = false, digit = false, symbol = false;
    for (unsigned char c : password) {
        if (std::islower(c)) lower = true;
        else if (std::isupper(c)) upper = true;
        else if (std::isdigit(c)) digit = true;
        else symbol = true;
    }
    const int classes = int(lower) + int(upper) + int(digit) + int(symbol);
    if (classes < 2) {
        reason = "Password must mix at least two of: lowercase, uppercase, digits, symbols";
        return false;
    }
    return true;
}

}
