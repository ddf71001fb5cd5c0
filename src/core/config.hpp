#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

struct SshSettings {
    int connect_timeout = SSH_CONNECT_TIMEOUT_SECS;
    int keepalive_interval = SSH_KEEPALIVE_INTERVAL_SECS;
    int keepalive_max_missed = SSH_KEEPALIVE_MAX_MISSED;
};

struct RetrySettings {
    int max_backoff = static_cast<int>(RETRY_MAX_BACKOFF_MS / 1000);   // seconds
    int monitor_interval = MONITOR_INTERVAL_MS;                         // ms
};

struct ForwardSettings {
    std::string bind_address = FORWARD_BIND_ADDRESS;
    std::string endpoint_target = FORWARD_ENDPOINT_TARGET;
};

struct SessionSettings {
    int duration_hours = SESSION_DURATION_HOURS;
    int max_inactivity_hours = SESSION_MAX_INACTIVITY_HOURS;
    int sweep_interval_minutes = SESSION_SWEEP_INTERVAL_MINUTES;
    int kdf_iterations = KDF_ITERATIONS;
    std::string oidc_secret;        // falls back to $TUNNELD_OIDC_SECRET, then built-in
};

// How a host (or a tunnel's endpoint override) authenticates.
struct AuthConfig {
    std::string type = "password";  // password | key | credential
    std::string password;
    std::string key;                // inline key text
    std::string key_file;           // or a path to one
    std::string key_password;
    std::string key_type;
    std::string credential_id;
    std::string user_id;            // credential owner
};

struct TunnelConnectionConfig {
    int source_port = 0;
    std::string endpoint_host;      // label of another configured host
    int endpoint_port = 0;
    int max_retries = DEFAULT_MAX_RETRIES;
    int retry_interval = DEFAULT_RETRY_INTERVAL_SECS;   // seconds
    bool auto_start = false;
    std::optional<AuthConfig> endpoint_auth;
};

struct HostConfig {
    std::string name;
    std::string ip;
    int port = SSH_DEFAULT_PORT;
    std::string username;
    AuthConfig auth;
    bool pin = false;
    std::vector<TunnelConnectionConfig> tunnels;
};

class Config {
public:
    // Load ~/.tunneld/config.yaml (or `path`)
    static Result<Config> load(const fs::path& path);

    // Parse config text (no file access)
    static Result<Config> parse(const std::string& yaml_text);

    const SshSettings& ssh() const { return ssh_; }
    const RetrySettings& retry() const { return retry_; }
    const ForwardSettings& forward() const { return forward_; }
    const SessionSettings& sessions() const { return sessions_; }
    const std::string& log_path() const { return log_path_; }
    const std::vector<HostConfig>& hosts() const { return hosts_; }

    // Resolved OIDC system secret: config, then env, then built-in default.
    std::string oidc_secret() const;

public:
    Config() = default;

private:
    SshSettings ssh_;
    RetrySettings retry_;
    ForwardSettings forward_;
    SessionSettings sessions_;
    std::string log_path_;
    std::vector<HostConfig> hosts_;

    friend class ConfigBuilder;
};

bool config_exists(const fs::path& path);

fs::path get_config_dir();
fs::path get_config_path();

// Write a commented default config to `path` unless one exists.
Result<void> create_default_config(const fs::path& path);
