#include <gtest/gtest.h>
#include <crypto/aead.hpp>
#include <core/utils.hpp>

static std::string hex_of(const KeyBuffer& k) {
    return hex_encode(k.data(), k.size());
}

TEST(Aead, Pbkdf2KnownVector) {
    std::vector<uint8_t> salt = {'s', 'a', 'l', 't'};
    KeyBuffer out;
    ASSERT_TRUE(pbkdf2_sha256("password", salt, 1, 32, out));
    EXPECT_EQ(hex_of(out), "120fb6cffcf8b32c43e7225256c4f837a86548c92ccc35480805987cb70be17b");
}

TEST(Aead, HkdfKnownVector) {
    KeyBuffer ikm(22);
    for (size_t i = 0; i < ikm.size(); i++) ikm.data()[i] = 0x0b;
    std::vector<uint8_t> salt;
    for (uint8_t i = 0; i <= 0x0c; i++) salt.push_back(i);
    std::string info;
    for (int c = 0xf0; c <= 0xf9; c++) info.push_back(static_cast<char>(c));

    KeyBuffer okm;
    ASSERT_TRUE(hkdf_sha256(ikm, salt, info, 42, okm));
    EXPECT_EQ(hex_of(okm),
              "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf34007208d5b887185865");
}

TEST(Aead, SealUsesFreshIv) {
    KeyBuffer key = KeyBuffer::random(32);
    const uint8_t msg[] = {1, 2, 3, 4};
    Sealed a, b;
    ASSERT_TRUE(aead_seal(key, msg, sizeof(msg), a));
    ASSERT_TRUE(aead_seal(key, msg, sizeof(msg), b));
    EXPECT_EQ(a.iv.size(), 16u);
    EXPECT_EQ(a.tag.size(), 16u);
    EXPECT_NE(a.iv, b.iv);
    EXPECT_NE(a.data, b.data);
}

TEST(Aead, OpenRejectsWrongKeyAndTampering) {
    KeyBuffer key = KeyBuffer::random(32);
    KeyBuffer other = KeyBuffer::random(32);
    const uint8_t msg[] = {'d', 'e', 'k'};
    Sealed sealed;
    ASSERT_TRUE(aead_seal(key, msg, sizeof(msg), sealed));

    KeyBuffer out;
    ASSERT_TRUE(aead_open(key, sealed, out));
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out.data()[0], 'd');

    KeyBuffer wrong;
    EXPECT_FALSE(aead_open(other, sealed, wrong));
    EXPECT_TRUE(wrong.empty());

    Sealed tampered = sealed;
    tampered.data[0] ^= 0x01;
    EXPECT_FALSE(aead_open(key, tampered, wrong));
}

TEST(Aead, SealRequires256BitKey) {
    KeyBuffer short_key = KeyBuffer::random(16);
    const uint8_t msg[] = {0};
    Sealed sealed;
    EXPECT_FALSE(aead_seal(short_key, msg, sizeof(msg), sealed));
}
