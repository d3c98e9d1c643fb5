#include "test_support.h"

#include "base64.h"
#include "blob_store.h"
#include "errors.h"
#include "wallet/encryption_mode.h"
#include "wallet/wallet_file.h"

#include <cstdlib>
#include <string>

using namespace tollgate;
using testing_support::TempDir;

static const char* KNOWN_KEY = "0x4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318";
static const char* KNOWN_ADDR = "0x2c7536E3605D9C16a7a3D7b1898e529396a65c23";

static ErrorCode resolve_error(Wallet& w) {
    try {
        w.resolve();
    } catch (const EngineError& e) {
        return e.code();
    }
    return ErrorCode::NONE;
}

int main(){
    ::unsetenv(PRIVATE_KEY_ENV);
    ::unsetenv(WALLET_KEY_ENV);

    // Mode names and detection
    TEST_CHECK(detect_encryption_mode("") == EncryptionModeName::MACHINE_BOUND, "legacy record is machine-bound");
    TEST_CHECK(detect_encryption_mode("password") == EncryptionModeName::PASSWORD, "password tag");
    bool threw = false;
    try { detect_encryption_mode("quantum"); }
    catch (const EngineError& e) { threw = e.code() == ErrorCode::UNKNOWN_ENCRYPTION_MODE; }
    TEST_CHECK(threw, "unknown tag rejected");

    std::string reason;
    TEST_CHECK(!check_password_strength("short1", reason), "too short");
    TEST_CHECK(!check_password_strength("alllowercase", reason), "single character class");
    TEST_CHECK(check_password_strength("correct horse 9", reason), "two classes, long enough");

    // Password wallet: wrong password fails, right one decrypts
    {
        TempDir dir;
        FileBlobStore store(dir.path());
        std::string err;
        TEST_CHECK(store.open(err), "open store");

        Wallet creator(store);
        WalletOptions opts;
        opts.mode = EncryptionModeName::PASSWORD;
        opts.password = "weak";
        threw = false;
        try { creator.import_key(KNOWN_KEY, opts); }
        catch (const EngineError& e) { threw = e.code() == ErrorCode::WEAK_PASSWORD; }
        TEST_CHECK(threw, "weak password refused at creation");
        TEST_CHECK(!creator.exists(), "nothing written for a refused password");

        opts.password = "Tollgate-pass-42";
        WalletInfo info = creator.import_key(KNOWN_KEY, opts);
        TEST_CHECK(info.address == KNOWN_ADDR, "imported address");
        TEST_CHECK(info.mode == EncryptionModeName::PASSWORD, "password mode recorded");
        TEST_CHECK(creator.mode() == EncryptionModeName::PASSWORD, "mode read back");

        std::string raw;
        TEST_CHECK(store.get(WALLET_FILE, raw), "wallet.json written");
        TEST_CHECK(raw.find("4c0883a6") == std::string::npos, "key not stored in clear");
        TEST_CHECK(raw.find("\"encryptionMode\":\"password\"") != std::string::npos, "mode tag stored");

        int prompts = 0;
        Wallet wrong(store, [&](const std::string&) { ++prompts; return std::string("Wrong-pass-99"); });
        TEST_CHECK(resolve_error(wrong) == ErrorCode::DECRYPT_FAILED, "wrong password gives decrypt_failed");
        TEST_CHECK(wrong.passwords().has(KNOWN_ADDR), "entered password is remembered for the session");
        TEST_CHECK(resolve_error(wrong) == ErrorCode::DECRYPT_FAILED, "cached wrong password still fails");
        TEST_CHECK(prompts == 1, "prompted once per session");

        Wallet right(store, [](const std::string&) { return std::string("Tollgate-pass-42"); });
        std::shared_ptr<ResolvedKey> k = right.resolve();
        TEST_CHECK(k && k->address == KNOWN_ADDR, "right password decrypts");
        TEST_CHECK(k->priv.size() == 32, "raw 32-byte key");

        Wallet cancelled(store, [](const std::string&) -> std::string {
            throw EngineError(ErrorCode::PROMPT_CANCELLED, "EOF");
        });
        TEST_CHECK(resolve_error(cancelled) == ErrorCode::PROMPT_CANCELLED, "cancelled prompt propagates");

        // Migrate to machine-bound, then resolve without any prompt
        WalletInfo moved = right.migrate(EncryptionModeName::MACHINE_BOUND);
        TEST_CHECK(moved.address == KNOWN_ADDR && moved.mode == EncryptionModeName::MACHINE_BOUND, "migrated");
        Wallet machine(store);
        TEST_CHECK(machine.resolve()->address == KNOWN_ADDR, "machine-bound decrypts after migration");
    }

    // Env-injected wallet needs the same key material to decrypt
    {
        TempDir dir;
        FileBlobStore store(dir.path());
        std::string err;
        TEST_CHECK(store.open(err), "open store");

        const std::string material = base64_encode(std::vector<uint8_t>(32, 0x5a));
        ::setenv(WALLET_KEY_ENV, material.c_str(), 1);
        Wallet w(store);
        WalletOptions opts;
        opts.mode = EncryptionModeName::ENV_INJECTED;
        WalletInfo info = w.create(opts);
        TEST_CHECK(w.resolve()->address == info.address, "env-injected round trip");

        threw = false;
        try { w.create(opts); }
        catch (const EngineError& e) { threw = e.code() == ErrorCode::WALLET_EXISTS; }
        TEST_CHECK(threw, "create refuses to overwrite");

        const std::string other = base64_encode(std::vector<uint8_t>(32, 0x11));
        ::setenv(WALLET_KEY_ENV, other.c_str(), 1);
        TEST_CHECK(resolve_error(w) == ErrorCode::DECRYPT_FAILED, "different env key cannot decrypt");

        ::unsetenv(WALLET_KEY_ENV);
        TEST_CHECK(resolve_error(w) == ErrorCode::DERIVE_KEY_FAILED, "missing env key");

        // The private-key override bypasses the file entirely
        ::setenv(PRIVATE_KEY_ENV, KNOWN_KEY, 1);
        TEST_CHECK(w.resolve()->address == KNOWN_ADDR, "TOLLGATE_PRIVATE_KEY wins");
        ::setenv(PRIVATE_KEY_ENV, "0x1234", 1);
        TEST_CHECK(resolve_error(w) == ErrorCode::INVALID_PRIVATE_KEY, "malformed override rejected");
        ::unsetenv(PRIVATE_KEY_ENV);

        TEST_CHECK(w.remove(), "remove wallet");
        TEST_CHECK(resolve_error(w) == ErrorCode::NO_WALLET, "no wallet after remove");
        TEST_CHECK(!w.remove(), "second remove reports nothing removed");
    }

    // Unknown mode tag in the file surfaces on resolve
    {
        TempDir dir;
        FileBlobStore store(dir.path());
        std::string err;
        TEST_CHECK(store.open(err), "open store");
        TEST_CHECK(store.put(WALLET_FILE,
            "{\"address\":\"0x7E5F4552091A69125d5DFCb7b8C2659029395Bdf\",\"networkId\":\"eip155:324705682\","
            "\"encryptionMode\":\"hsm\",\"encryptedKey\":\"00\",\"keySalt\":\"00\",\"keyIv\":\"00\"}", err),
            "write record");
        Wallet w(store);
        TEST_CHECK(resolve_error(w) == ErrorCode::UNKNOWN_ENCRYPTION_MODE, "unknown mode in wallet.json");
    }

    std::printf("test_encryption_modes: OK\n");
    return 0;
}
