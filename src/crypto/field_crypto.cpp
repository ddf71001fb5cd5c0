#include "field_crypto.hpp"
#include "aead.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

namespace field_crypto {

static std::string field_context(const std::string& record_id, const std::string& field_name) {
    return fmt::format("{}:{}", record_id, field_name);
}

Result<EncryptedField> encrypt(const std::string& plaintext, const KeyBuffer& dek,
                               const std::string& record_id, const std::string& field_name) {
    if (plaintext.empty()) return Result<EncryptedField>::Ok(EncryptedField{});

    KeyBuffer salt = KeyBuffer::random(FIELD_SALT_LENGTH);
    if (salt.empty()) {
        return Result<EncryptedField>::Err("Random number generator failure");
    }
    std::vector<uint8_t> salt_bytes(salt.data(), salt.data() + salt.size());

    KeyBuffer field_key;
    if (!hkdf_sha256(dek, salt_bytes, field_context(record_id, field_name), KEK_LENGTH, field_key)) {
        return Result<EncryptedField>::Err("Field key derivation failed");
    }

    Sealed sealed;
    if (!aead_seal(field_key, reinterpret_cast<const uint8_t*>(plaintext.data()),
                   plaintext.size(), sealed)) {
        return Result<EncryptedField>::Err("Field encryption failed");
    }

    EncryptedField out;
    out.data = hex_encode(sealed.data);
    out.iv = hex_encode(sealed.iv);
    out.tag = hex_encode(sealed.tag);
    out.salt = hex_encode(salt_bytes);
    out.record_id = record_id;
    return Result<EncryptedField>::Ok(out);
}

Result<std::string> decrypt(const EncryptedField& field, const KeyBuffer& dek,
                            const std::string& field_name) {
    if (field.empty()) return Result<std::string>::Ok("");

    if (field.record_id.empty()) {
        return Result<std::string>::Err(
            fmt::format("Encrypted field '{}' has no record id", field_name));
    }

    Sealed sealed;
    std::vector<uint8_t> salt;
    if (!hex_decode(field.data, sealed.data) || !hex_decode(field.iv, sealed.iv) ||
        !hex_decode(field.tag, sealed.tag) || !hex_decode(field.salt, salt)) {
        return Result<std::string>::Err(
            fmt::format("Encrypted field '{}' is malformed", field_name));
    }

    KeyBuffer field_key;
    if (!hkdf_sha256(dek, salt, field_context(field.record_id, field_name), KEK_LENGTH, field_key)) {
        return Result<std::string>::Err("Field key derivation failed");
    }

    KeyBuffer plain;
    if (!aead_open(field_key, sealed, plain)) {
        return Result<std::string>::Err(
            fmt::format("Failed to decrypt field '{}'", field_name));
    }
    return Result<std::string>::Ok(
        std::string(reinterpret_cast<const char*>(plain.data()), plain.size()));
}

} // namespace field_crypto
