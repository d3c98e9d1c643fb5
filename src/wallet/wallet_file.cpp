#include "wallet/wallet_file.h"
#include "address.h"
#include "errors.h"
#include "hex.h"
#include "json.h"
#include "log.h"
#include "networks.h"
#include "paths.h"
#include "crypto/ecdsa_secp256k1.h"
#include "crypto/secure_random.h"

#include <cstdlib>

namespace tollgate {

Wallet::Wallet(BlobStore& store, PasswordPrompt prompt)
    : store_(store), prompt_(std::move(prompt)) {}

static JNode record_to_json(const WalletRecord& r) {
    JObject o;
    o["address"] = jstr(r.address);
    o["networkId"] = jstr(r.network_id);
    if (!r.encryption_mode.empty()) o["encryptionMode"] = jstr(r.encryption_mode);
    o["encryptedKey"] = jstr(r.encrypted_key);
    o["keySalt"] = jstr(r.key_salt);
    o["keyIv"] = jstr(r.key_iv);
    return jobj(std::move(o));
}

bool Wallet::exists() const {
    return store_.exists(WALLET_FILE);
}

bool Wallet::load(WalletRecord& out) const {
    std::string raw;
    if (!store_.get(WALLET_FILE, raw)) return false;
    JNode j;
    if (!json_parse(raw, j) || !json_is_object(j)) {
        log_warn(LogCategory::WALLET, "wallet.json is not valid JSON");
        return false;
    }
    WalletRecord r;
    if (!json_get_string(j, "address", r.address) ||
        !json_get_string(j, "encryptedKey", r.encrypted_key) ||
        !json_get_string(j, "keySalt", r.key_salt) ||
        !json_get_string(j, "keyIv", r.key_iv)) {
        log_warn(LogCategory::WALLET, "wallet.json is missing required fields");
        return false;
    }
    r.network_id = json_string_or(j, "networkId", DEFAULT_NETWORK);
    r.encryption_mode = json_string_or(j, "encryptionMode");
    out = std::move(r);
    return true;
}

std::string Wallet::password_for_new_wallet(const std::string& given, const std::string& address) {
    std::string pw = given;
    if (pw.empty()) {
        if (!prompt_) throw EngineError(ErrorCode::WEAK_PASSWORD, "a password is required for password mode");
        pw = prompt_(address);
    }
    std::string reason;
    if (!check_password_strength(pw, reason)) {
        secure_wipe(pw);
        throw EngineError(ErrorCode::WEAK_PASSWORD, reason);
    }
    return pw;
}

WalletInfo Wallet::write_new(const std::vector<uint8_t>& priv, const WalletOptions& opts) {
    const std::string network = opts.network.empty() ? DEFAULT_NETWORK : opts.network;
    if (!find_network(network)) throw EngineError(ErrorCode::UNSUPPORTED_NETWORK, "unknown network " + network);

    if (!opts.force) {
        WalletRecord existing;
        if (load(existing)) {
            throw EngineError(ErrorCode::WALLET_EXISTS,
                              "Wallet already exists (address: " + existing.address + "). Use --force to overwrite.");
        }
        if (exists()) throw EngineError(ErrorCode::WALLET_EXISTS, "wallet.json exists. Use --force to overwrite.");
    }

    const std::string address = address_from_private_key(priv);
    if (address.empty()) throw EngineError(ErrorCode::INVALID_PRIVATE_KEY, "key is not a valid secp256k1 scalar");

    std::string password;
    if (opts.mode == EncryptionModeName::PASSWORD) password = password_for_new_wallet(opts.password, address);
    std::unique_ptr<EncryptionBackend> backend = make_backend(opts.mode, password);
    secure_wipe(password);

    const std::vector<uint8_t> salt = random_bytes(KDF_SALT_LEN);
    const SymmetricKey key = backend->derive_key(salt);
    const SealedData sealed = backend->encrypt(priv, key);

    std::vector<uint8_t> combined = sealed.ciphertext;
    combined.insert(combined.end(), sealed.tag.begin(), sealed.tag.end());

    WalletRecord rec;
    rec.address = address;
    rec.network_id = network;
    rec.encryption_mode = encryption_mode_to_string(opts.mode);
    rec.encrypted_key = to_hex(combined);
    rec.key_salt = to_hex(salt);
    rec.key_iv = to_hex(sealed.iv);

    std::string err;
    if (!store_.put(WALLET_FILE, json_dump(record_to_json(rec)), err)) {
        throw EngineError(ErrorCode::STORAGE_ERROR, "wallet write failed: " + err);
    }
    log_info(LogCategory::WALLET, std::string("wallet ") + address + " saved (" + rec.encryption_mode + ")");

    WalletInfo info;
    info.address = address;
    info.network = network;
    info.storage_path = join_path(store_.root(), WALLET_FILE);
    info.mode = opts.mode;
    return info;
}

WalletInfo Wallet::create(const WalletOptions& opts) {
    std::vector<uint8_t> priv;
    if (!crypto::Secp256k1::generate_priv(priv)) {
        throw EngineError(ErrorCode::ENCRYPTION_FAILED, "could not generate a private key");
    }
    try {
        WalletInfo info = write_new(priv, opts);
        secure_wipe(priv);
        return info;
    } catch (const EngineError&) {
        secure_wipe(priv);
        throw;
    }
}

WalletInfo Wallet::import_key(const std::string& key_hex, const WalletOptions& opts) {
    std::string norm = key_hex;
    if (norm.size() >= 2 && norm[0] == '0' && (norm[1] == 'x' || norm[1] == 'X')) norm = norm.substr(2);
    if (norm.size() != 64 || !is_hex_string(norm)) {
        secure_wipe(norm);
        throw EngineError(ErrorCode::INVALID_PRIVATE_KEY,
                          "Invalid private key: must be 64 hex characters (with optional 0x prefix)");
    }
    std::vector<uint8_t> priv = from_hex(norm);
    secure_wipe(norm);
    try {
        WalletInfo info = write_new(priv, opts);
        secure_wipe(priv);
        return info;
    } catch (const EngineError&) {
        secure_wipe(priv);
        throw;
    }
}

std::string Wallet::address() const {
    WalletRecord rec;
    if (!load(rec)) throw EngineError(ErrorCode::NO_WALLET, "No wallet configured. Run: tollgate wallet create");
    return rec.address;
}

EncryptionModeName Wallet::mode() const {
    WalletRecord rec;
    if (!load(rec)) throw EngineError(ErrorCode::NO_WALLET, "No wallet configured. Run: tollgate wallet create");
    return detect_encryption_mode(rec.encryption_mode);
}

// Plaintext is the 32 raw key bytes; a 64-character hex form is also accepted.
static std::vector<uint8_t> key_from_plaintext(std::vector<uint8_t>& plain) {
    std::vector<uint8_t> priv;
    if (plain.size() == 32) {
        priv = plain;
    } else if (plain.size() == 64) {
        std::string hex(plain.begin(), plain.end());
        priv = from_hex(hex);
        secure_wipe(hex);
    }
    secure_wipe(plain);
    if (priv.size() != 32) throw EngineError(ErrorCode::DECRYPT_FAILED, "decrypted key has unexpected length");
    return priv;
}

std::vector<uint8_t> Wallet::decrypt_record(const WalletRecord& rec) {
    const EncryptionModeName m = detect_encryption_mode(rec.encryption_mode);

    const std::vector<uint8_t> combined = from_hex(rec.encrypted_key);
    const std::vector<uint8_t> salt = from_hex(rec.key_salt);
    const std::vector<uint8_t> iv = from_hex(rec.key_iv);
    if (combined.size() <= AEAD_TAG_LEN || iv.size() != AEAD_IV_LEN) {
        throw EngineError(ErrorCode::DECRYPT_FAILED, "wallet.json ciphertext is malformed");
    }
    SealedData sealed;
    sealed.ciphertext.assign(combined.begin(), combined.end() - AEAD_TAG_LEN);
    sealed.tag.assign(combined.end() - AEAD_TAG_LEN, combined.end());
    sealed.iv = iv;

    std::string password;
    if (m == EncryptionModeName::PASSWORD) {
        password = passwords_.get_or_prompt(rec.address, [this](const std::string& addr) {
            if (!prompt_) throw EngineError(ErrorCode::PROMPT_CANCELLED, "no password source for " + addr);
            return prompt_(addr);
        });
    }
    std::unique_ptr<EncryptionBackend> backend = make_backend(m, password);
    secure_wipe(password);

    const SymmetricKey key = backend->derive_key(salt);
    std::vector<uint8_t> plain = backend->decrypt(sealed, key);
    return key_from_plaintext(plain);
}

std::shared_ptr<ResolvedKey> Wallet::resolve() {
    auto out = std::make_shared<ResolvedKey>();

    const char* env_key = std::getenv(PRIVATE_KEY_ENV);
    if (env_key && *env_key) {
        if (!is_private_key_hex(env_key)) {
            throw EngineError(ErrorCode::INVALID_PRIVATE_KEY,
                              std::string(PRIVATE_KEY_ENV) + " must be 0x followed by 64 hex digits");
        }
        out->priv = from_hex(env_key);
    } else {
        WalletRecord rec;
        if (!load(rec)) throw EngineError(ErrorCode::NO_WALLET, "No wallet configured. Run: tollgate wallet create");
        out->priv = decrypt_record(rec);
    }

    out->address = address_from_private_key(out->priv);
    if (out->address.empty()) throw EngineError(ErrorCode::INVALID_PRIVATE_KEY, "key is not a valid secp256k1 scalar");
    return out;
}

WalletInfo Wallet::migrate(EncryptionModeName new_mode, const std::string& new_password) {
    WalletRecord rec;
    if (!load(rec)) throw EngineError(ErrorCode::NO_WALLET, "No wallet configured. Run: tollgate wallet create");

    std::vector<uint8_t> priv = decrypt_record(rec);
    WalletOptions opts;
    opts.network = rec.network_id;
    opts.force = true;
    opts.mode = new_mode;
    opts.password = new_password;
    try {
        WalletInfo info = write_new(priv, opts);
        secure_wipe(priv);
        passwords_.remove(rec.address);
        log_info(LogCategory::WALLET, std::string("wallet migrated to ") + encryption_mode_to_string(new_mode));
        return info;
    } catch (const EngineError&) {
        secure_wipe(priv);
        throw;
    }
}

bool Wallet::remove() {
    if (!exists()) return false;
    std::string err;
    if (!store_.del(WALLET_FILE, err)) throw EngineError(ErrorCode::STORAGE_ERROR, "wallet delete failed: " + err);
    log_info(LogCategory::WALLET, "wallet removed");
    return true;
}

}
