#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <crypto/field_crypto.hpp>
#include <crypto/key_buffer.hpp>

namespace fs = std::filesystem;

// A stored host credential. Secret fields are encrypted per field under the
// owner's DEK; everything else is plaintext.
struct CredentialRecord {
    std::string id;
    std::string owner_user_id;
    std::string name;
    std::string username;
    std::string auth_type = "password";     // "password" | "key"
    std::string key_type;
    EncryptedField password;
    EncryptedField private_key;
    EncryptedField key_password;
};

// Plaintext input for sealing a new record.
struct PlainCredential {
    std::string id;
    std::string owner_user_id;
    std::string name;
    std::string username;
    std::string auth_type = "password";
    std::string key_type;
    std::string password;
    std::string private_key;
    std::string key_password;
};

// Field names double as the HKDF context, so they are part of the format.
constexpr const char* FIELD_PASSWORD     = "password";
constexpr const char* FIELD_PRIVATE_KEY  = "private_key";
constexpr const char* FIELD_KEY_PASSWORD = "key_password";

// Encrypt a credential's secret fields under the owner's DEK.
Result<CredentialRecord> seal_credential(const PlainCredential& plain, const KeyBuffer& dek);

class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    virtual std::optional<CredentialRecord> find(const std::string& id) = 0;
    virtual std::vector<CredentialRecord> list(const std::string& owner_user_id) = 0;
    virtual Result<void> save(const CredentialRecord& record) = 0;
};

class MemoryCredentialStore : public CredentialStore {
public:
    std::optional<CredentialRecord> find(const std::string& id) override;
    std::vector<CredentialRecord> list(const std::string& owner_user_id) override;
    Result<void> save(const CredentialRecord& record) override;

private:
    std::mutex mutex_;
    std::map<std::string, CredentialRecord> records_;
};

// ~/.tunneld/credentials.yaml
class YamlCredentialStore : public CredentialStore {
public:
    explicit YamlCredentialStore(const fs::path& path);

    static fs::path default_path();

    std::optional<CredentialRecord> find(const std::string& id) override;
    std::vector<CredentialRecord> list(const std::string& owner_user_id) override;
    Result<void> save(const CredentialRecord& record) override;

private:
    fs::path path_;
    std::mutex mutex_;

    // Err when the file exists but cannot be parsed
    Result<std::map<std::string, CredentialRecord>> read_all();
};
