#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <core/types.hpp>

namespace fs = std::filesystem;

// KDF parameters for deriving a user's KEK. Byte fields are hex.
struct KekSalt {
    std::string salt;
    int iterations = 0;
    std::string algorithm;
    std::string created_at;
};

// The user's DEK wrapped under the KEK (AES-256-GCM).
struct EncryptedDek {
    std::string data;
    std::string iv;
    std::string tag;
    std::string algorithm;
    std::string created_at;
};

struct UserKeyRecord {
    KekSalt kek_salt;
    EncryptedDek encrypted_dek;
};

// Persistence for per-user key records. Salt and wrapped DEK are always
// written together so a password change never leaves a mismatched pair.
class KeyStore {
public:
    virtual ~KeyStore() = default;

    virtual std::optional<UserKeyRecord> load(const std::string& user_id) = 0;
    virtual Result<void> store(const std::string& user_id, const UserKeyRecord& record) = 0;
};

class MemoryKeyStore : public KeyStore {
public:
    std::optional<UserKeyRecord> load(const std::string& user_id) override;
    Result<void> store(const std::string& user_id, const UserKeyRecord& record) override;

private:
    std::mutex mutex_;
    std::map<std::string, UserKeyRecord> records_;
};

// ~/.tunneld/keys.yaml, rewritten whole on every store().
class YamlKeyStore : public KeyStore {
public:
    explicit YamlKeyStore(const fs::path& path);

    static fs::path default_path();

    std::optional<UserKeyRecord> load(const std::string& user_id) override;
    Result<void> store(const std::string& user_id, const UserKeyRecord& record) override;

private:
    fs::path path_;
    std::mutex mutex_;

    // Err when the file exists but cannot be parsed
    Result<std::map<std::string, UserKeyRecord>> read_all();
};
