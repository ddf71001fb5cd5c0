#include "key_buffer.hpp"
#include <openssl/crypto.h>
#include <openssl/rand.h>

void secure_wipe(std::string& s) {
    if (!s.empty()) OPENSSL_cleanse(&s[0], s.size());
}

void secure_wipe(std::vector<uint8_t>& v) {
    if (!v.empty()) OPENSSL_cleanse(v.data(), v.size());
}

KeyBuffer KeyBuffer::random(size_t size) {
    KeyBuffer buf(size);
    if (size > 0 && RAND_bytes(buf.data(), static_cast<int>(size)) != 1) {
        return KeyBuffer();
    }
    return buf;
}

bool KeyBuffer::is_zeroed() const {
    uint8_t acc = 0;
    for (uint8_t b : bytes_) acc |= b;
    return acc == 0;
}
