#include "user_crypto.hpp"
#include "aead.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <chrono>
#include <vector>

static int64_t system_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

UserCryptoManager::UserCryptoManager(KeyStore& store, UserCryptoOptions options, NowFn now)
    : store_(store), options_(std::move(options)), now_(now ? std::move(now) : system_now_ms) {
}

UserCryptoManager::~UserCryptoManager() {
    stop_sweeper();
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, s] : sessions_) s.dek->wipe();
    sessions_.clear();
}

void UserCryptoManager::set_session_expired_callback(ExpiredCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_expired_ = std::move(cb);
}

// ── Key derivation / wrapping ─────────────────────────────

std::optional<KekSalt> UserCryptoManager::new_kek_salt() const {
    KeyBuffer salt = KeyBuffer::random(KEK_SALT_LENGTH);
    if (salt.empty()) return std::nullopt;

    KekSalt s;
    s.salt = hex_encode(salt.data(), salt.size());
    s.iterations = options_.kdf_iterations;
    s.algorithm = KDF_ALGORITHM;
    s.created_at = now_iso();
    return s;
}

bool UserCryptoManager::derive_kek(const std::string& password, const KekSalt& salt,
                                   KeyBuffer& kek) const {
    std::vector<uint8_t> salt_bytes;
    if (!hex_decode(salt.salt, salt_bytes) || salt_bytes.empty()) return false;
    if (salt.iterations <= 0) return false;
    return pbkdf2_sha256(password, salt_bytes, salt.iterations, KEK_LENGTH, kek);
}

bool UserCryptoManager::derive_oidc_key(const std::string& user_id, KeyBuffer& kek) const {
    std::vector<uint8_t> salt(user_id.begin(), user_id.end());
    return pbkdf2_sha256(options_.oidc_secret, salt, options_.kdf_iterations, KEK_LENGTH, kek);
}

bool UserCryptoManager::wrap_dek(const KeyBuffer& dek, const KeyBuffer& kek,
                                 EncryptedDek& out) const {
    Sealed sealed;
    if (!aead_seal(kek, dek.data(), dek.size(), sealed)) return false;
    out.data = hex_encode(sealed.data);
    out.iv = hex_encode(sealed.iv);
    out.tag = hex_encode(sealed.tag);
    out.algorithm = AEAD_ALGORITHM;
    out.created_at = now_iso();
    return true;
}

bool UserCryptoManager::unwrap_dek(const EncryptedDek& in, const KeyBuffer& kek,
                                   KeyBuffer& dek) const {
    Sealed sealed;
    if (!hex_decode(in.data, sealed.data) || !hex_decode(in.iv, sealed.iv) ||
        !hex_decode(in.tag, sealed.tag)) {
        return false;
    }
    KeyBuffer plain;
    if (!aead_open(kek, sealed, plain)) return false;
    if (plain.size() != static_cast<size_t>(DEK_LENGTH)) return false;
    dek = std::move(plain);
    return true;
}

// OIDC records are keyed by the system secret and only unlock through
// authenticate_oidc_user().
static bool is_oidc_record(const UserKeyRecord& record) {
    return record.kek_salt.algorithm == OIDC_KDF_ALGORITHM;
}

// ── Sessions ──────────────────────────────────────────────

bool UserCryptoManager::is_expired(const Session& s, int64_t now) const {
    return now > s.expires_at || now - s.last_activity > options_.max_inactivity_ms;
}

void UserCryptoManager::open_session(const std::string& user_id, KeyBuffer dek) {
    int64_t now = now_();
    Session s;
    s.dek = std::make_shared<KeyBuffer>(std::move(dek));
    s.last_activity = now;
    s.expires_at = now + options_.session_duration_ms;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(user_id);
    if (it != sessions_.end()) {
        it->second.dek->wipe();
        it->second = std::move(s);
    } else {
        sessions_.emplace(user_id, std::move(s));
    }
}

void UserCryptoManager::fire_expired(const std::string& user_id) {
    ExpiredCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cb = on_expired_;
    }
    log_info(fmt::format("UserCrypto: session for {} expired", user_id));
    if (cb) cb(user_id);
}

// ── Registration / authentication ─────────────────────────

Result<void> UserCryptoManager::setup_user_encryption(const std::string& user_id,
                                                      const std::string& password) {
    auto salt = new_kek_salt();
    if (!salt) return Result<void>::Err("Random number generator failure");

    KeyBuffer kek;
    if (!derive_kek(password, *salt, kek)) return Result<void>::Err("Key derivation failed");

    KeyBuffer dek = KeyBuffer::random(DEK_LENGTH);
    if (dek.empty()) return Result<void>::Err("Random number generator failure");

    UserKeyRecord record;
    record.kek_salt = *salt;
    if (!wrap_dek(dek, kek, record.encrypted_dek)) {
        return Result<void>::Err("Failed to wrap data key");
    }

    auto r = store_.store(user_id, record);
    if (r.is_err()) return r;

    log_info(fmt::format("UserCrypto: provisioned keys for {}", user_id));
    return Result<void>::Ok();
}

Result<void> UserCryptoManager::setup_oidc_user_encryption(const std::string& user_id) {
    KeyBuffer kek;
    if (!derive_oidc_key(user_id, kek)) return Result<void>::Err("Key derivation failed");

    KeyBuffer dek = KeyBuffer::random(DEK_LENGTH);
    if (dek.empty()) return Result<void>::Err("Random number generator failure");

    UserKeyRecord record;
    record.kek_salt.salt = hex_encode(reinterpret_cast<const uint8_t*>(user_id.data()),
                                      user_id.size());
    record.kek_salt.iterations = options_.kdf_iterations;
    record.kek_salt.algorithm = OIDC_KDF_ALGORITHM;
    record.kek_salt.created_at = now_iso();
    if (!wrap_dek(dek, kek, record.encrypted_dek)) {
        return Result<void>::Err("Failed to wrap data key");
    }

    auto r = store_.store(user_id, record);
    if (r.is_err()) return r;

    open_session(user_id, std::move(dek));
    log_info(fmt::format("UserCrypto: provisioned OIDC keys for {}", user_id));
    return Result<void>::Ok();
}

bool UserCryptoManager::authenticate_user(const std::string& user_id,
                                          const std::string& password) {
    auto record = store_.load(user_id);

    KeyBuffer kek;
    if (!record || is_oidc_record(*record)) {
        // Same PBKDF2 cost as a real attempt, then fail.
        KekSalt dummy;
        dummy.salt = std::string(KEK_SALT_LENGTH * 2, '0');
        dummy.iterations = options_.kdf_iterations;
        derive_kek(password, dummy, kek);
        return false;
    }

    KeyBuffer dek;
    if (!derive_kek(password, record->kek_salt, kek) ||
        !unwrap_dek(record->encrypted_dek, kek, dek)) {
        log_warn(fmt::format("UserCrypto: authentication failed for {}", user_id));
        return false;
    }

    open_session(user_id, std::move(dek));
    return true;
}

bool UserCryptoManager::authenticate_oidc_user(const std::string& user_id) {
    auto record = store_.load(user_id);

    if (record) {
        KeyBuffer kek;
        KeyBuffer dek;
        if (derive_oidc_key(user_id, kek) && unwrap_dek(record->encrypted_dek, kek, dek)) {
            open_session(user_id, std::move(dek));
            return true;
        }
        log_warn(fmt::format("UserCrypto: OIDC key record for {} unusable, re-provisioning", user_id));
    }

    auto r = setup_oidc_user_encryption(user_id);
    if (r.is_err()) {
        log_error(fmt::format("UserCrypto: OIDC provisioning for {} failed: {}", user_id, r.error));
        return false;
    }
    return true;
}

std::shared_ptr<const KeyBuffer> UserCryptoManager::get_user_data_key(const std::string& user_id) {
    int64_t now = now_();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(user_id);
        if (it == sessions_.end()) return nullptr;

        if (!is_expired(it->second, now)) {
            it->second.last_activity = now;
            // Copied under the lock so a concurrent logout or sweep cannot
            // wipe bytes a caller is still reading.
            return std::make_shared<const KeyBuffer>(it->second.dek->clone());
        }

        it->second.dek->wipe();
        sessions_.erase(it);
    }
    fire_expired(user_id);
    return nullptr;
}

std::shared_ptr<const KeyBuffer> UserCryptoManager::live_session_key(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(user_id);
    if (it == sessions_.end()) return nullptr;
    return it->second.dek;
}

void UserCryptoManager::logout_user(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(user_id);
    if (it == sessions_.end()) return;
    it->second.dek->wipe();
    sessions_.erase(it);
}

bool UserCryptoManager::is_user_unlocked(const std::string& user_id) {
    return get_user_data_key(user_id) != nullptr;
}

bool UserCryptoManager::change_user_password(const std::string& user_id,
                                             const std::string& old_password,
                                             const std::string& new_password) {
    auto record = store_.load(user_id);
    if (!record || is_oidc_record(*record)) return false;

    KeyBuffer old_kek;
    KeyBuffer dek;
    if (!derive_kek(old_password, record->kek_salt, old_kek) ||
        !unwrap_dek(record->encrypted_dek, old_kek, dek)) {
        log_warn(fmt::format("UserCrypto: password change rejected for {}", user_id));
        return false;
    }

    auto salt = new_kek_salt();
    if (!salt) return false;

    KeyBuffer new_kek;
    UserKeyRecord updated;
    updated.kek_salt = *salt;
    if (!derive_kek(new_password, *salt, new_kek) ||
        !wrap_dek(dek, new_kek, updated.encrypted_dek)) {
        return false;
    }

    auto r = store_.store(user_id, updated);
    if (r.is_err()) {
        log_error(fmt::format("UserCrypto: cannot persist new keys for {}: {}", user_id, r.error));
        return false;
    }

    logout_user(user_id);
    log_info(fmt::format("UserCrypto: password changed for {}", user_id));
    return true;
}

// ── Sweep ─────────────────────────────────────────────────

size_t UserCryptoManager::sweep_expired_sessions() {
    int64_t now = now_();
    std::vector<std::string> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (is_expired(it->second, now)) {
                it->second.dek->wipe();
                expired.push_back(it->first);
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& id : expired) fire_expired(id);
    return expired.size();
}

void UserCryptoManager::start_sweeper() {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    if (sweeper_.joinable()) return;
    sweeper_stop_ = false;
    sweeper_ = std::thread([this]() {
        std::unique_lock<std::mutex> lk(sweeper_mutex_);
        while (!sweeper_stop_) {
            sweeper_cv_.wait_for(lk, std::chrono::milliseconds(options_.sweep_interval_ms),
                                 [this]() { return sweeper_stop_; });
            if (sweeper_stop_) break;
            lk.unlock();
            size_t n = sweep_expired_sessions();
            if (n > 0) log_info(fmt::format("UserCrypto: sweep evicted {} session(s)", n));
            lk.lock();
        }
    });
}

void UserCryptoManager::stop_sweeper() {
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        sweeper_stop_ = true;
    }
    sweeper_cv_.notify_all();
    if (sweeper_.joinable()) sweeper_.join();
}

size_t UserCryptoManager::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}
