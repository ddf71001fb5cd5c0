#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <core/constants.hpp>
#include <core/types.hpp>
#include "key_buffer.hpp"
#include "key_store.hpp"

struct UserCryptoOptions {
    int64_t session_duration_ms = int64_t(SESSION_DURATION_HOURS) * 3600 * 1000;
    int64_t max_inactivity_ms = int64_t(SESSION_MAX_INACTIVITY_HOURS) * 3600 * 1000;
    int64_t sweep_interval_ms = int64_t(SESSION_SWEEP_INTERVAL_MINUTES) * 60 * 1000;
    int kdf_iterations = KDF_ITERATIONS;
    std::string oidc_secret = OIDC_DEFAULT_SECRET;
};

// Envelope encryption sessions. A password (or, for OIDC users, a system
// secret) derives the KEK, the KEK unwraps the user's persisted DEK, and the
// DEK lives in memory only while the user's session is unlocked.
//
// Authentication failures are plain false/nullptr. A missing record costs
// the same KDF work as a wrong password.
class UserCryptoManager {
public:
    using NowFn = std::function<int64_t()>;   // milliseconds
    using ExpiredCallback = std::function<void(const std::string& user_id)>;

    explicit UserCryptoManager(KeyStore& store, UserCryptoOptions options = {},
                               NowFn now = nullptr);
    ~UserCryptoManager();

    UserCryptoManager(const UserCryptoManager&) = delete;
    UserCryptoManager& operator=(const UserCryptoManager&) = delete;

    // Invoked (outside the session lock) when a session times out, either
    // on access or in the sweep. Not invoked for logout or password change.
    void set_session_expired_callback(ExpiredCallback cb);

    // New salt, new DEK, wrapped and persisted. Does not unlock.
    Result<void> setup_user_encryption(const std::string& user_id, const std::string& password);

    // New DEK wrapped under the OIDC system key, persisted, and unlocked.
    Result<void> setup_oidc_user_encryption(const std::string& user_id);

    bool authenticate_user(const std::string& user_id, const std::string& password);

    // Always succeeds unless provisioning itself fails: a missing or
    // unreadable record is replaced by a fresh one.
    bool authenticate_oidc_user(const std::string& user_id);

    // A private copy of the session's DEK, or nullptr when locked or
    // expired. Refreshes the idle timer. The copy is zeroed when the last
    // reference drops; eviction never touches it.
    std::shared_ptr<const KeyBuffer> get_user_data_key(const std::string& user_id);

    // The live session buffer, which eviction zeroes in place. For
    // inspection only; crypto code uses get_user_data_key().
    std::shared_ptr<const KeyBuffer> live_session_key(const std::string& user_id) const;

    void logout_user(const std::string& user_id);
    bool is_user_unlocked(const std::string& user_id);

    // Re-wraps the DEK under a freshly salted KEK from new_password and
    // locks the session.
    bool change_user_password(const std::string& user_id, const std::string& old_password,
                              const std::string& new_password);

    // Evict every session past its idle or absolute expiry. Returns the
    // number evicted.
    size_t sweep_expired_sessions();

    // Background sweep every options.sweep_interval_ms.
    void start_sweeper();
    void stop_sweeper();

    size_t session_count() const;

private:
    struct Session {
        std::shared_ptr<KeyBuffer> dek;
        int64_t last_activity = 0;
        int64_t expires_at = 0;
    };

    KeyStore& store_;
    UserCryptoOptions options_;
    NowFn now_;

    mutable std::mutex mutex_;
    std::map<std::string, Session> sessions_;
    ExpiredCallback on_expired_;

    std::thread sweeper_;
    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    bool sweeper_stop_ = false;

    bool is_expired(const Session& s, int64_t now) const;
    void open_session(const std::string& user_id, KeyBuffer dek);
    void fire_expired(const std::string& user_id);

    bool derive_kek(const std::string& password, const KekSalt& salt, KeyBuffer& kek) const;
    bool derive_oidc_key(const std::string& user_id, KeyBuffer& kek) const;
    bool wrap_dek(const KeyBuffer& dek, const KeyBuffer& kek, EncryptedDek& out) const;
    bool unwrap_dek(const EncryptedDek& in, const KeyBuffer& kek, KeyBuffer& dek) const;
    std::optional<KekSalt> new_kek_salt() const;
};
