#include "aead.hpp"
#include <core/constants.hpp>
#include <memory>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
using PkeyCtx = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

} // namespace

bool pbkdf2_sha256(const std::string& password, const std::vector<uint8_t>& salt,
                   int iterations, size_t length, KeyBuffer& out) {
    if (iterations <= 0 || length == 0) return false;
    KeyBuffer key(length);
    int rc = PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                               salt.data(), static_cast<int>(salt.size()),
                               iterations, EVP_sha256(),
                               static_cast<int>(length), key.data());
    if (rc != 1) return false;
    out = std::move(key);
    return true;
}

bool hkdf_sha256(const KeyBuffer& ikm, const std::vector<uint8_t>& salt,
                 const std::string& info, size_t length, KeyBuffer& out) {
    if (ikm.empty() || length == 0) return false;
    PkeyCtx ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
    if (!ctx) return false;

    if (EVP_PKEY_derive_init(ctx.get()) <= 0) return false;
    if (EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0) return false;
    if (EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), salt.data(), static_cast<int>(salt.size())) <= 0)
        return false;
    if (EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), ikm.data(), static_cast<int>(ikm.size())) <= 0)
        return false;
    if (EVP_PKEY_CTX_add1_hkdf_info(ctx.get(),
                                    reinterpret_cast<const unsigned char*>(info.data()),
                                    static_cast<int>(info.size())) <= 0)
        return false;

    KeyBuffer key(length);
    size_t out_len = length;
    if (EVP_PKEY_derive(ctx.get(), key.data(), &out_len) <= 0 || out_len != length) return false;
    out = std::move(key);
    return true;
}

bool aead_seal(const KeyBuffer& key, const uint8_t* plaintext, size_t len, Sealed& out) {
    if (key.size() != static_cast<size_t>(KEK_LENGTH)) return false;

    Sealed sealed;
    sealed.iv.resize(AEAD_IV_LENGTH);
    if (RAND_bytes(sealed.iv.data(), AEAD_IV_LENGTH) != 1) return false;

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) return false;
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        return false;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, AEAD_IV_LENGTH, nullptr) != 1)
        return false;
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), sealed.iv.data()) != 1)
        return false;

    sealed.data.resize(len + 16);
    int out_len = 0;
    int final_len = 0;
    if (len > 0 &&
        EVP_EncryptUpdate(ctx.get(), sealed.data.data(), &out_len, plaintext,
                          static_cast<int>(len)) != 1)
        return false;
    if (EVP_EncryptFinal_ex(ctx.get(), sealed.data.data() + out_len, &final_len) != 1)
        return false;
    sealed.data.resize(static_cast<size_t>(out_len + final_len));

    sealed.tag.resize(AEAD_TAG_LENGTH);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, AEAD_TAG_LENGTH,
                            sealed.tag.data()) != 1)
        return false;

    out = std::move(sealed);
    return true;
}

bool aead_open(const KeyBuffer& key, const Sealed& in, KeyBuffer& out) {
    if (key.size() != static_cast<size_t>(KEK_LENGTH)) return false;
    if (in.iv.empty() || in.tag.size() != static_cast<size_t>(AEAD_TAG_LENGTH)) return false;

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) return false;
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        return false;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(in.iv.size()), nullptr) != 1)
        return false;
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), in.iv.data()) != 1)
        return false;

    KeyBuffer plain(in.data.size() + 16);
    int out_len = 0;
    int final_len = 0;
    if (!in.data.empty() &&
        EVP_DecryptUpdate(ctx.get(), plain.data(), &out_len, in.data.data(),
                          static_cast<int>(in.data.size())) != 1)
        return false;

    std::vector<uint8_t> tag = in.tag;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, AEAD_TAG_LENGTH, tag.data()) != 1)
        return false;
    if (EVP_DecryptFinal_ex(ctx.get(), plain.data() + out_len, &final_len) != 1)
        return false;

    size_t total = static_cast<size_t>(out_len + final_len);
    out = KeyBuffer(plain.data(), total);
    return true;
}
