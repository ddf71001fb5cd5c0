#include <gtest/gtest.h>
#include <crypto/field_crypto.hpp>

class FieldCryptoTest : public ::testing::Test {
protected:
    KeyBuffer dek = KeyBuffer::random(32);
};

TEST_F(FieldCryptoTest, RoundTrip) {
    auto enc = field_crypto::encrypt("hunter2", dek, "cred-1", "password");
    ASSERT_TRUE(enc.is_ok());
    EXPECT_EQ(enc.value.record_id, "cred-1");
    EXPECT_EQ(enc.value.salt.size(), 64u);
    EXPECT_EQ(enc.value.iv.size(), 32u);
    EXPECT_EQ(enc.value.data.find("hunter2"), std::string::npos);

    auto dec = field_crypto::decrypt(enc.value, dek, "password");
    ASSERT_TRUE(dec.is_ok());
    EXPECT_EQ(dec.value, "hunter2");
}

TEST_F(FieldCryptoTest, EmptyPlaintextIsEmptyField) {
    auto enc = field_crypto::encrypt("", dek, "cred-1", "key_password");
    ASSERT_TRUE(enc.is_ok());
    EXPECT_TRUE(enc.value.empty());

    auto dec = field_crypto::decrypt(enc.value, dek, "key_password");
    ASSERT_TRUE(dec.is_ok());
    EXPECT_EQ(dec.value, "");
}

TEST_F(FieldCryptoTest, BoundToFieldName) {
    auto enc = field_crypto::encrypt("hunter2", dek, "cred-1", "password");
    ASSERT_TRUE(enc.is_ok());
    EXPECT_TRUE(field_crypto::decrypt(enc.value, dek, "private_key").is_err());
}

TEST_F(FieldCryptoTest, BoundToRecordId) {
    auto enc = field_crypto::encrypt("hunter2", dek, "cred-1", "password");
    ASSERT_TRUE(enc.is_ok());
    EncryptedField moved = enc.value;
    moved.record_id = "cred-2";
    EXPECT_TRUE(field_crypto::decrypt(moved, dek, "password").is_err());
}

TEST_F(FieldCryptoTest, WrongKeyFails) {
    auto enc = field_crypto::encrypt("hunter2", dek, "cred-1", "password");
    ASSERT_TRUE(enc.is_ok());
    KeyBuffer other = KeyBuffer::random(32);
    EXPECT_TRUE(field_crypto::decrypt(enc.value, other, "password").is_err());
}

TEST_F(FieldCryptoTest, MissingRecordIdFails) {
    auto enc = field_crypto::encrypt("hunter2", dek, "cred-1", "password");
    ASSERT_TRUE(enc.is_ok());
    enc.value.record_id.clear();
    auto dec = field_crypto::decrypt(enc.value, dek, "password");
    ASSERT_TRUE(dec.is_err());
    EXPECT_NE(dec.error.find("no record id"), std::string::npos);
}

TEST_F(FieldCryptoTest, MalformedHexFails) {
    auto enc = field_crypto::encrypt("hunter2", dek, "cred-1", "password");
    ASSERT_TRUE(enc.is_ok());
    enc.value.tag = "zz";
    EXPECT_TRUE(field_crypto::decrypt(enc.value, dek, "password").is_err());
}
