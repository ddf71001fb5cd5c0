#pragma once

#include <cstdint>

// ── SSH transport ───────────────────────────────────────────
constexpr int SSH_DEFAULT_PORT            = 22;
constexpr int SSH_CONNECT_TIMEOUT_SECS    = 20;    // TCP connect + handshake + auth
constexpr int SSH_KEEPALIVE_INTERVAL_SECS = 30;
constexpr int SSH_KEEPALIVE_MAX_MISSED    = 3;
constexpr int SSH_CHANNEL_OPEN_TIMEOUT_SECS = 30;
constexpr int SSH_POLL_STEP_MS            = 10;

// Broadly compatible algorithm lists. Older network gear still speaks
// group1/group14-sha1, CBC ciphers and hmac-md5.
constexpr const char* SSH_KEX_PREFS =
    "diffie-hellman-group14-sha256,diffie-hellman-group14-sha1,"
    "diffie-hellman-group1-sha1,diffie-hellman-group-exchange-sha256,"
    "diffie-hellman-group-exchange-sha1,ecdh-sha2-nistp256,"
    "ecdh-sha2-nistp384,ecdh-sha2-nistp521";
constexpr const char* SSH_CIPHER_PREFS =
    "aes128-ctr,aes192-ctr,aes256-ctr,aes128-gcm@openssh.com,"
    "aes256-gcm@openssh.com,aes128-cbc,aes192-cbc,aes256-cbc,3des-cbc";
constexpr const char* SSH_MAC_PREFS =
    "hmac-sha2-256-etm@openssh.com,hmac-sha2-512-etm@openssh.com,"
    "hmac-sha2-256,hmac-sha2-512,hmac-sha1,hmac-md5";
constexpr const char* SSH_COMPRESSION_PREFS = "none,zlib@openssh.com,zlib";

// ── Port forwarding ─────────────────────────────────────────
constexpr int FORWARD_LISTEN_QUEUE        = 16;
constexpr int FORWARD_BUF_SIZE            = 16384;
constexpr int FORWARD_POLL_MS             = 50;
constexpr int FORWARD_MAX_CONNECTIONS     = 256;   // spliced pairs per tunnel
constexpr const char* FORWARD_BIND_ADDRESS    = "localhost";
constexpr const char* FORWARD_ENDPOINT_TARGET = "localhost";

// ── Retry / supervision ─────────────────────────────────────
constexpr int64_t RETRY_MAX_BACKOFF_MS    = 5 * 60 * 1000;   // 5 minutes
constexpr int     MONITOR_INTERVAL_MS     = 2000;            // liveness probe while connected
constexpr int     AUTOSTART_DELAY_MS      = 1000;
constexpr int     DEFAULT_MAX_RETRIES     = 3;
constexpr int     DEFAULT_RETRY_INTERVAL_SECS = 5;

// ── User crypto sessions ────────────────────────────────────
constexpr int KDF_ITERATIONS              = 100000;          // PBKDF2-SHA256
constexpr int KEK_LENGTH                  = 32;
constexpr int DEK_LENGTH                  = 32;
constexpr int KEK_SALT_LENGTH             = 32;
constexpr int AEAD_IV_LENGTH              = 16;
constexpr int AEAD_TAG_LENGTH             = 16;
constexpr int FIELD_SALT_LENGTH           = 32;
constexpr int SESSION_DURATION_HOURS      = 24;
constexpr int SESSION_MAX_INACTIVITY_HOURS = 6;
constexpr int SESSION_SWEEP_INTERVAL_MINUTES = 5;
constexpr const char* KDF_ALGORITHM       = "pbkdf2-sha256";
constexpr const char* OIDC_KDF_ALGORITHM  = "pbkdf2-sha256-oidc";
constexpr const char* AEAD_ALGORITHM      = "aes-256-gcm";
constexpr const char* OIDC_DEFAULT_SECRET = "tunneld-oidc-system-secret-default";
