#include "crypto/key_engine.h"
#include "crypto/secure_random.h"
#include "errors.h"

#include <openssl/evp.h>
#include <openssl/crypto.h> // OPENSSL_cleanse

namespace tollgate {

SymmetricKey::~SymmetricKey() {
    secure_wipe(bytes);
}

static SymmetricKey pbkdf2_sha256(const std::vector<uint8_t>& salt,
                                  const uint8_t* input, size_t input_len)
{
    if(salt.size() != KDF_SALT_LEN){
        throw EngineError(ErrorCode::DERIVE_KEY_FAILED, "salt must be exactly 32 bytes");
    }
    SymmetricKey key;
    key.bytes.resize(AEAD_KEY_LEN);
    // PKCS5_PBKDF2_HMAC tolerates a null pointer only with zero length
    static const char empty = 0;
    const char* pass = input_len ? reinterpret_cast<const char*>(input) : &empty;
    if(1 != PKCS5_PBKDF2_HMAC(pass, (int)input_len,
                              salt.data(), (int)salt.size(), KDF_ITERATIONS,
                              EVP_sha256(), (int)key.bytes.size(), key.bytes.data()))
    {
        throw EngineError(ErrorCode::DERIVE_KEY_FAILED, "PBKDF2 failed");
    }
    return key;
}

SymmetricKey derive_key(const std::vector<uint8_t>& salt, const std::string& password){
    if(password.empty()){
        throw EngineError(ErrorCode::DERIVE_KEY_FAILED, "password must not be empty");
    }
    return pbkdf2_sha256(salt, reinterpret_cast<const uint8_t*>(password.data()), password.size());
}

SymmetricKey derive_key(const std::vector<uint8_t>& salt, const std::vector<uint8_t>& raw_input){
    if(raw_input.empty()){
        throw EngineError(ErrorCode::DERIVE_KEY_FAILED, "key material must not be empty");
    }
    return pbkdf2_sha256(salt, raw_input.data(), raw_input.size());
}

SealedData aead_encrypt(const std::vector<uint8_t>& plaintext, const SymmetricKey& key){
    if(key.bytes.size() != AEAD_KEY_LEN){
        throw EngineError(ErrorCode::ENCRYPTION_FAILED, "key must be 32 bytes");
    }
    SealedData out;
    out.iv = random_bytes(AEAD_IV_LEN);
    out.tag.resize(AEAD_TAG_LEN);

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if(!ctx) throw EngineError(ErrorCode::ENCRYPTION_FAILED, "EVP_CIPHER_CTX_new failed");

    std::string err;
    do{
        if(1!=EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr)){ err="EncryptInit"; break; }
        if(1!=EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, (int)AEAD_IV_LEN, nullptr)){ err="GCM_SET_IVLEN"; break; }
        if(1!=EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.bytes.data(), out.iv.data())){ err="EncryptInit key/iv"; break; }

        int outl=0;
        out.ciphertext.resize(plaintext.size());
        if(!plaintext.empty()){
            if(1!=EVP_EncryptUpdate(ctx, out.ciphertext.data(), &outl, plaintext.data(), (int)plaintext.size())){ err="EncryptUpdate"; break; }
        }
        int tmplen=0;
        if(1!=EVP_EncryptFinal_ex(ctx, out.ciphertext.data()+outl, &tmplen)){ err="EncryptFinal"; break; }
        out.ciphertext.resize((size_t)(outl + tmplen));

        if(1!=EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, (int)AEAD_TAG_LEN, out.tag.data())){ err="GET_TAG"; break; }
    }while(false);

    EVP_CIPHER_CTX_free(ctx);
    if(!err.empty()){
        secure_wipe(out.ciphertext);
        throw EngineError(ErrorCode::ENCRYPTION_FAILED, err);
    }
    return out;
}

std::vector<uint8_t> aead_decrypt(const SealedData& sealed, const SymmetricKey& key){
    if(key.bytes.size() != AEAD_KEY_LEN || sealed.iv.size() != AEAD_IV_LEN || sealed.tag.size() != AEAD_TAG_LEN){
        throw EngineError(ErrorCode::DECRYPT_FAILED, "malformed key, iv or tag");
    }

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if(!ctx) throw EngineError(ErrorCode::DECRYPT_FAILED, "EVP_CIPHER_CTX_new failed");

    std::vector<uint8_t> pt(sealed.ciphertext.size());
    std::string err;
    do{
        if(1!=EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr)){ err="DecryptInit"; break; }
        if(1!=EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, (int)AEAD_IV_LEN, nullptr)){ err="GCM_SET_IVLEN"; break; }
        if(1!=EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.bytes.data(), sealed.iv.data())){ err="DecryptInit key/iv"; break; }

        int outl=0;
        if(!sealed.ciphertext.empty()){
            if(1!=EVP_DecryptUpdate(ctx, pt.data(), &outl, sealed.ciphertext.data(), (int)sealed.ciphertext.size())){ err="DecryptUpdate"; break; }
        }

        // Set expected tag *before* final
        if(1!=EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, (int)AEAD_TAG_LEN,
                                  const_cast<uint8_t*>(sealed.tag.data()))){ err="SET_TAG"; break; }

        int tmplen=0;
        if(1!=EVP_DecryptFinal_ex(ctx, pt.data()+outl, &tmplen)){
            err="authentication failed (wrong key or corrupted data)";
            break;
        }
        pt.resize((size_t)(outl + tmplen));
    }while(false);

    EVP_CIPHER_CTX_free(ctx);
    if(!err.empty()){
        secure_wipe(pt);
        throw EngineError(ErrorCode::DECRYPT_FAILED, err);
    }
    return pt;
}

}
