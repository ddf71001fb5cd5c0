#pragma once

#include <string>
#include <optional>
#include <variant>
#include <functional>
#include <cstdint>
#include <core/types.hpp>
#include <core/constants.hpp>

// ── Auth material ───────────────────────────────────────────

struct PasswordAuth {
    std::string password;
};

struct KeyAuth {
    std::string private_key;                 // PEM / OpenSSH text
    std::optional<std::string> passphrase;
    std::optional<std::string> key_type;     // hint only; "auto" is ignored
};

// Reference to an encrypted credential record owned by a user.
struct CredentialRef {
    std::string credential_id;
    std::string owner_user_id;
};

using AuthMaterial = std::variant<PasswordAuth, KeyAuth, CredentialRef>;

// A host as configured: where to connect and how to authenticate.
struct HostRef {
    std::string name;           // display name, may be empty
    std::string address;
    int port = SSH_DEFAULT_PORT;
    std::string username;
    AuthMaterial auth = PasswordAuth{};
};

// Display name if set, otherwise "user@ip".
std::string host_label(const HostRef& host);

// "{hostLabel}_{sourcePort}_{endpointPort}"; status consumers correlate on it.
std::string tunnel_name(const std::string& host_label, int source_port, int endpoint_port);

// ── Tunnel spec ─────────────────────────────────────────────

struct TunnelSpec {
    std::string name;
    HostRef source;

    // Endpoint is either pre-resolved or looked up by label at every attempt,
    // so a host added while retries are in flight is picked up.
    std::string endpoint_host;
    std::optional<HostRef> endpoint;
    std::optional<AuthMaterial> endpoint_auth_override;

    int source_port = 0;
    int endpoint_port = 0;
    int max_retries = DEFAULT_MAX_RETRIES;       // 0 disables retry
    int64_t retry_interval_ms = DEFAULT_RETRY_INTERVAL_SECS * 1000;
    bool auto_start = false;
    bool is_pinned = false;
};

// Checks port ranges, name and required source fields.
Result<void> validate_spec(const TunnelSpec& spec);

// ── Status model ────────────────────────────────────────────

enum class TunnelState {
    Disconnected,
    Connecting,
    Connected,
    Retrying,
    Waiting,
    Disconnecting,
    Failed,
};

const char* tunnel_state_name(TunnelState state);

// Disconnected and Failed accept a fresh connect().
inline bool is_idle_state(TunnelState s) {
    return s == TunnelState::Disconnected || s == TunnelState::Failed;
}

struct TunnelStatus {
    TunnelState state = TunnelState::Disconnected;
    std::optional<std::string> reason;
    std::optional<ErrorType> error_type;
    int retry_count = 0;
    int max_retries = 0;
    std::optional<int> next_retry_in_seconds;   // only in Waiting
    bool retry_exhausted = false;
    bool manual_disconnect = false;
};

using StatusListener = std::function<void(const std::string& name, const TunnelStatus& status)>;
