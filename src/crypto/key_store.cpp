#include "key_store.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

// ── MemoryKeyStore ────────────────────────────────────────

std::optional<UserKeyRecord> MemoryKeyStore::load(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(user_id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

Result<void> MemoryKeyStore::store(const std::string& user_id, const UserKeyRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[user_id] = record;
    return Result<void>::Ok();
}

// ── YamlKeyStore ──────────────────────────────────────────

YamlKeyStore::YamlKeyStore(const fs::path& path) : path_(path) {}

fs::path YamlKeyStore::default_path() {
    return platform::home_dir() / ".tunneld" / "keys.yaml";
}

Result<std::map<std::string, UserKeyRecord>> YamlKeyStore::read_all() {
    using R = Result<std::map<std::string, UserKeyRecord>>;
    std::map<std::string, UserKeyRecord> records;
    if (!fs::exists(path_)) return R::Ok(records);

    try {
        YAML::Node root = YAML::LoadFile(path_.string());
        YAML::Node users = root["users"];
        if (!users || users.IsNull()) return R::Ok(records);
        if (!users.IsMap()) return R::Err(path_.string() + ": 'users' is not a map");

        for (const auto& entry : users) {
            std::string user_id = entry.first.as<std::string>();
            const YAML::Node& n = entry.second;

            UserKeyRecord r;
            YAML::Node salt = n["kek_salt"];
            r.kek_salt.salt = salt["salt"].as<std::string>("");
            r.kek_salt.iterations = salt["iterations"].as<int>(0);
            r.kek_salt.algorithm = salt["algorithm"].as<std::string>("");
            r.kek_salt.created_at = salt["created_at"].as<std::string>("");

            YAML::Node dek = n["encrypted_dek"];
            r.encrypted_dek.data = dek["data"].as<std::string>("");
            r.encrypted_dek.iv = dek["iv"].as<std::string>("");
            r.encrypted_dek.tag = dek["tag"].as<std::string>("");
            r.encrypted_dek.algorithm = dek["algorithm"].as<std::string>("");
            r.encrypted_dek.created_at = dek["created_at"].as<std::string>("");

            records[user_id] = r;
        }
    } catch (const std::exception& e) {
        return R::Err(fmt::format("cannot parse {}: {}", path_.string(), e.what()));
    }
    return R::Ok(records);
}

std::optional<UserKeyRecord> YamlKeyStore::load(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto records = read_all();
    if (records.is_err()) {
        // Unreadable key file: every user reads as unprovisioned
        log_error("KeyStore: " + records.error);
        return std::nullopt;
    }
    auto it = records.value.find(user_id);
    if (it == records.value.end()) return std::nullopt;
    return it->second;
}

Result<void> YamlKeyStore::store(const std::string& user_id, const UserKeyRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = read_all();
    if (existing.is_err()) {
        // Rewriting now would drop every other user's record
        log_error("KeyStore: refusing to store " + user_id + ": " + existing.error);
        return Result<void>::Err("Key store is unreadable: " + existing.error);
    }
    auto records = std::move(existing.value);
    records[user_id] = record;

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "users" << YAML::Value << YAML::BeginMap;
    for (const auto& [id, r] : records) {
        out << YAML::Key << id << YAML::Value << YAML::BeginMap;

        out << YAML::Key << "kek_salt" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "salt" << YAML::Value << r.kek_salt.salt;
        out << YAML::Key << "iterations" << YAML::Value << r.kek_salt.iterations;
        out << YAML::Key << "algorithm" << YAML::Value << r.kek_salt.algorithm;
        out << YAML::Key << "created_at" << YAML::Value << r.kek_salt.created_at;
        out << YAML::EndMap;

        out << YAML::Key << "encrypted_dek" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "data" << YAML::Value << r.encrypted_dek.data;
        out << YAML::Key << "iv" << YAML::Value << r.encrypted_dek.iv;
        out << YAML::Key << "tag" << YAML::Value << r.encrypted_dek.tag;
        out << YAML::Key << "algorithm" << YAML::Value << r.encrypted_dek.algorithm;
        out << YAML::Key << "created_at" << YAML::Value << r.encrypted_dek.created_at;
        out << YAML::EndMap;

        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;

    return platform::write_private_file(path_, std::string(out.c_str()) + "\n");
}
