#pragma once
#include "blob_store.h"
#include "wallet/encryption_mode.h"
#include "wallet/key_cache.h"

#include <functional>
#include <memory>
#include <string>

namespace tollgate {

static constexpr const char* WALLET_FILE = "wallet.json";
static constexpr const char* PRIVATE_KEY_ENV = "TOLLGATE_PRIVATE_KEY";

// wallet.json. `encryption_mode` is empty for legacy machine-bound records.
struct WalletRecord {
    std::string address;
    std::string network_id;
    std::string encryption_mode;
    std::string encrypted_key;  // hex(ciphertext || tag)
    std::string key_salt;       // hex, 32 bytes
    std::string key_iv;         // hex, 12 bytes
};

struct WalletInfo {
    std::string address;
    std::string network;
    std::string storage_path;
    EncryptionModeName mode{EncryptionModeName::MACHINE_BOUND};
};

struct WalletOptions {
    std::string network;        // empty = DEFAULT_NETWORK
    bool force{false};
    EncryptionModeName mode{EncryptionModeName::MACHINE_BOUND};
    std::string password;       // password mode; prompted for when empty
};

// The single signing wallet of a data directory.
class Wallet {
public:
    using PasswordPrompt = std::function<std::string(const std::string& address)>;

    explicit Wallet(BlobStore& store, PasswordPrompt prompt = PasswordPrompt());

    bool exists() const;
    // False when absent or malformed.
    bool load(WalletRecord& out) const;

    // Throws WALLET_EXISTS unless forced, UNSUPPORTED_NETWORK, WEAK_PASSWORD.
    WalletInfo create(const WalletOptions& opts);
    // `key_hex`: 64 hex digits, optional 0x. Throws INVALID_PRIVATE_KEY plus the create errors.
    WalletInfo import_key(const std::string& key_hex, const WalletOptions& opts);

    // Throws NO_WALLET.
    std::string address() const;
    EncryptionModeName mode() const;

    // TOLLGATE_PRIVATE_KEY first, then the encrypted record. Password wallets
    // ask through the session password cache. Throws NO_WALLET,
    // INVALID_PRIVATE_KEY, DECRYPT_FAILED, UNKNOWN_ENCRYPTION_MODE,
    // DERIVE_KEY_FAILED or PROMPT_CANCELLED.
    std::shared_ptr<ResolvedKey> resolve();

    // Decrypts under the current backend, re-encrypts under `new_mode` with a
    // fresh salt and nonce, and replaces the record.
    WalletInfo migrate(EncryptionModeName new_mode, const std::string& new_password = "");

    // False when there was no wallet.
    bool remove();

    SessionPasswordCache& passwords() { return passwords_; }

private:
    WalletInfo write_new(const std::vector<uint8_t>& priv, const WalletOptions& opts);
    std::vector<uint8_t> decrypt_record(const WalletRecord& rec);
    std::string password_for_new_wallet(const std::string& given, const std::string& address);

    BlobStore& store_;
    PasswordPrompt prompt_;
    SessionPasswordCache passwords_;
};

}
