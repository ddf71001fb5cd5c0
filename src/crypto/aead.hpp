#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "key_buffer.hpp"

// Ciphertext with its GCM nonce and authentication tag.
struct Sealed {
    std::vector<uint8_t> data;
    std::vector<uint8_t> iv;
    std::vector<uint8_t> tag;
};

// PBKDF2-HMAC-SHA256. `out` receives `length` bytes; false on failure.
bool pbkdf2_sha256(const std::string& password, const std::vector<uint8_t>& salt,
                   int iterations, size_t length, KeyBuffer& out);

// HKDF-SHA256 (extract + expand) with `info` as the context string.
bool hkdf_sha256(const KeyBuffer& ikm, const std::vector<uint8_t>& salt,
                 const std::string& info, size_t length, KeyBuffer& out);

// AES-256-GCM with a fresh random 16-byte IV.
bool aead_seal(const KeyBuffer& key, const uint8_t* plaintext, size_t len, Sealed& out);

// Returns false when the tag does not verify (wrong key or tampered data).
// `out` is only filled on success.
bool aead_open(const KeyBuffer& key, const Sealed& in, KeyBuffer& out);
