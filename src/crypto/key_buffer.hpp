#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Zero a string's storage in place (OPENSSL_cleanse; not elided by the optimizer).
void secure_wipe(std::string& s);
void secure_wipe(std::vector<uint8_t>& v);

// Owned key material. Zeroed on wipe() and on destruction, so eviction
// never depends on a caller remembering a cleanup call.
class KeyBuffer {
public:
    KeyBuffer() = default;
    explicit KeyBuffer(size_t size) : bytes_(size, 0) {}
    KeyBuffer(const uint8_t* data, size_t size) : bytes_(data, data + size) {}
    ~KeyBuffer() { wipe(); }

    KeyBuffer(const KeyBuffer&) = delete;
    KeyBuffer& operator=(const KeyBuffer&) = delete;

    KeyBuffer(KeyBuffer&& other) noexcept : bytes_(std::move(other.bytes_)) {
        other.bytes_.clear();
    }
    KeyBuffer& operator=(KeyBuffer&& other) noexcept {
        if (this != &other) {
            wipe();
            bytes_ = std::move(other.bytes_);
            other.bytes_.clear();
        }
        return *this;
    }

    // Cryptographically random bytes. Empty on RNG failure.
    static KeyBuffer random(size_t size);

    KeyBuffer clone() const { return KeyBuffer(bytes_.data(), bytes_.size()); }

    void wipe() { secure_wipe(bytes_); }

    uint8_t* data() { return bytes_.data(); }
    const uint8_t* data() const { return bytes_.data(); }
    size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }

    // True when every byte is zero (wiped, or never filled).
    bool is_zeroed() const;

private:
    std::vector<uint8_t> bytes_;
};
