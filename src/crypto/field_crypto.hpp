#pragma once

#include <string>
#include <core/types.hpp>
#include "key_buffer.hpp"

// One encrypted credential field. All byte fields are lowercase hex.
// The key is HKDF-SHA256(dek, salt, "{record_id}:{field_name}"), so a
// ciphertext moved to another record or field fails to decrypt.
struct EncryptedField {
    std::string data;
    std::string iv;
    std::string tag;
    std::string salt;
    std::string record_id;

    bool empty() const { return data.empty() && tag.empty(); }
};

namespace field_crypto {

// An empty plaintext encrypts to an empty field.
Result<EncryptedField> encrypt(const std::string& plaintext, const KeyBuffer& dek,
                               const std::string& record_id, const std::string& field_name);

// An empty field decrypts to "". Fails on a missing record id, malformed
// hex, or a tag mismatch (wrong key, wrong field, tampering).
Result<std::string> decrypt(const EncryptedField& field, const KeyBuffer& dek,
                            const std::string& field_name);

} // namespace field_crypto
