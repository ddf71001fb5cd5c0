#include "credential_store.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

Result<CredentialRecord> seal_credential(const PlainCredential& plain, const KeyBuffer& dek) {
    if (plain.id.empty()) return Result<CredentialRecord>::Err("Credential id is required");
    if (plain.owner_user_id.empty()) return Result<CredentialRecord>::Err("Credential owner is required");
    if (plain.auth_type != "password" && plain.auth_type != "key") {
        return Result<CredentialRecord>::Err("Unknown auth type: " + plain.auth_type);
    }

    CredentialRecord rec;
    rec.id = plain.id;
    rec.owner_user_id = plain.owner_user_id;
    rec.name = plain.name;
    rec.username = plain.username;
    rec.auth_type = plain.auth_type;
    rec.key_type = plain.key_type;

    auto pw = field_crypto::encrypt(plain.password, dek, plain.id, FIELD_PASSWORD);
    if (pw.is_err()) return Result<CredentialRecord>::Err(pw.error);
    auto key = field_crypto::encrypt(plain.private_key, dek, plain.id, FIELD_PRIVATE_KEY);
    if (key.is_err()) return Result<CredentialRecord>::Err(key.error);
    auto kp = field_crypto::encrypt(plain.key_password, dek, plain.id, FIELD_KEY_PASSWORD);
    if (kp.is_err()) return Result<CredentialRecord>::Err(kp.error);

    rec.password = pw.value;
    rec.private_key = key.value;
    rec.key_password = kp.value;
    return Result<CredentialRecord>::Ok(rec);
}

// ── MemoryCredentialStore ─────────────────────────────────

std::optional<CredentialRecord> MemoryCredentialStore::find(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

std::vector<CredentialRecord> MemoryCredentialStore::list(const std::string& owner_user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CredentialRecord> out;
    for (const auto& [id, r] : records_) {
        if (r.owner_user_id == owner_user_id) out.push_back(r);
    }
    return out;
}

Result<void> MemoryCredentialStore::save(const CredentialRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.id] = record;
    return Result<void>::Ok();
}

// ── YamlCredentialStore ───────────────────────────────────

static EncryptedField read_field(const YAML::Node& n) {
    EncryptedField f;
    if (!n || !n.IsMap()) return f;
    f.data = n["data"].as<std::string>("");
    f.iv = n["iv"].as<std::string>("");
    f.tag = n["tag"].as<std::string>("");
    f.salt = n["salt"].as<std::string>("");
    f.record_id = n["record_id"].as<std::string>("");
    return f;
}

static void write_field(YAML::Emitter& out, const char* key, const EncryptedField& f) {
    if (f.empty()) return;
    out << YAML::Key << key << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "data" << YAML::Value << f.data;
    out << YAML::Key << "iv" << YAML::Value << f.iv;
    out << YAML::Key << "tag" << YAML::Value << f.tag;
    out << YAML::Key << "salt" << YAML::Value << f.salt;
    out << YAML::Key << "record_id" << YAML::Value << f.record_id;
    out << YAML::EndMap;
}

YamlCredentialStore::YamlCredentialStore(const fs::path& path) : path_(path) {}

fs::path YamlCredentialStore::default_path() {
    return platform::home_dir() / ".tunneld" / "credentials.yaml";
}

Result<std::map<std::string, CredentialRecord>> YamlCredentialStore::read_all() {
    using R = Result<std::map<std::string, CredentialRecord>>;
    std::map<std::string, CredentialRecord> records;
    if (!fs::exists(path_)) return R::Ok(records);

    try {
        YAML::Node root = YAML::LoadFile(path_.string());
        YAML::Node creds = root["credentials"];
        if (!creds || creds.IsNull()) return R::Ok(records);
        if (!creds.IsSequence()) return R::Err(path_.string() + ": 'credentials' is not a list");

        for (const auto& n : creds) {
            CredentialRecord r;
            r.id = n["id"].as<std::string>("");
            if (r.id.empty()) continue;
            r.owner_user_id = n["user_id"].as<std::string>("");
            r.name = n["name"].as<std::string>("");
            r.username = n["username"].as<std::string>("");
            r.auth_type = n["auth_type"].as<std::string>("password");
            r.key_type = n["key_type"].as<std::string>("");
            r.password = read_field(n[FIELD_PASSWORD]);
            r.private_key = read_field(n[FIELD_PRIVATE_KEY]);
            r.key_password = read_field(n[FIELD_KEY_PASSWORD]);
            records[r.id] = r;
        }
    } catch (const std::exception& e) {
        return R::Err(fmt::format("cannot parse {}: {}", path_.string(), e.what()));
    }
    return R::Ok(records);
}

std::optional<CredentialRecord> YamlCredentialStore::find(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto records = read_all();
    if (records.is_err()) {
        log_error("CredentialStore: " + records.error);
        return std::nullopt;
    }
    auto it = records.value.find(id);
    if (it == records.value.end()) return std::nullopt;
    return it->second;
}

std::vector<CredentialRecord> YamlCredentialStore::list(const std::string& owner_user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CredentialRecord> out;
    auto records = read_all();
    if (records.is_err()) {
        log_error("CredentialStore: " + records.error);
        return out;
    }
    for (const auto& [id, r] : records.value) {
        if (r.owner_user_id == owner_user_id) out.push_back(r);
    }
    return out;
}

Result<void> YamlCredentialStore::save(const CredentialRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = read_all();
    if (existing.is_err()) {
        log_error("CredentialStore: refusing to save " + record.id + ": " + existing.error);
        return Result<void>::Err("Credential store is unreadable: " + existing.error);
    }
    auto records = std::move(existing.value);
    records[record.id] = record;

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "credentials" << YAML::Value << YAML::BeginSeq;
    for (const auto& [id, r] : records) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << r.id;
        out << YAML::Key << "user_id" << YAML::Value << r.owner_user_id;
        out << YAML::Key << "name" << YAML::Value << r.name;
        out << YAML::Key << "username" << YAML::Value << r.username;
        out << YAML::Key << "auth_type" << YAML::Value << r.auth_type;
        if (!r.key_type.empty()) out << YAML::Key << "key_type" << YAML::Value << r.key_type;
        write_field(out, FIELD_PASSWORD, r.password);
        write_field(out, FIELD_PRIVATE_KEY, r.private_key);
        write_field(out, FIELD_KEY_PASSWORD, r.key_password);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    return platform::write_private_file(path_, std::string(out.c_str()) + "\n");
}
