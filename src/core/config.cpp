#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <fmt/format.h>

namespace fs = std::filesystem;

bool config_exists(const fs::path& path) {
    return fs::exists(path);
}

fs::path get_config_dir() {
    return platform::home_dir() / ".tunneld";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

Result<void> create_default_config(const fs::path& config_path) {
    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const char* default_config = R"(# tunneld configuration

ssh:
  connect_timeout: 20        # seconds, TCP connect + handshake + auth
  keepalive_interval: 30     # seconds
  keepalive_max_missed: 3

retry:
  max_backoff: 300           # seconds, cap on the exponential backoff
  monitor_interval: 2000     # ms between liveness probes while connected

forward:
  bind_address: "localhost"  # listener address on the source host
  endpoint_target: "localhost"

sessions:
  duration_hours: 24
  max_inactivity_hours: 6
  sweep_interval_minutes: 5

# log:
#   path: "/tmp/tunneld_debug.log"

# hosts:
#   - name: "gateway"
#     ip: "203.0.113.10"
#     username: "ops"
#     auth: password
#     password: "..."
#     tunnels:
#       - source_port: 8080
#         endpoint_host: "db"
#         endpoint_port: 5432
#         max_retries: 3
#         retry_interval: 5
#         auto_start: true
#   - name: "db"
#     ip: "10.0.0.5"
#     username: "ops"
#     auth: credential
#     credential_id: "db-ops"
#     user_id: "alice"
hosts: []
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    if (!out) {
        return Result<void>::Err("Failed to write config file at " + config_path.string());
    }
    return Result<void>::Ok();
}

static AuthConfig parse_auth(const YAML::Node& node, const std::string& prefix) {
    AuthConfig a;
    auto key = [&](const char* k) { return prefix + k; };

    a.type = node[key("auth")].as<std::string>("password");
    a.password = node[key("password")].as<std::string>("");
    a.key = node[key("key")].as<std::string>("");
    a.key_file = node[key("key_file")].as<std::string>("");
    a.key_password = node[key("key_password")].as<std::string>("");
    a.key_type = node[key("key_type")].as<std::string>("");
    a.credential_id = node[key("credential_id")].as<std::string>("");
    a.user_id = node[key("user_id")].as<std::string>("");

    // "auth" omitted but a key supplied: treat as key auth
    if (!node[key("auth")] && (!a.key.empty() || !a.key_file.empty())) a.type = "key";
    if (!node[key("auth")] && !a.credential_id.empty()) a.type = "credential";
    return a;
}

static TunnelConnectionConfig parse_tunnel(const YAML::Node& node) {
    TunnelConnectionConfig t;
    t.source_port = node["source_port"].as<int>(0);
    t.endpoint_host = node["endpoint_host"].as<std::string>("");
    t.endpoint_port = node["endpoint_port"].as<int>(0);
    t.max_retries = node["max_retries"].as<int>(DEFAULT_MAX_RETRIES);
    t.retry_interval = node["retry_interval"].as<int>(DEFAULT_RETRY_INTERVAL_SECS);
    t.auto_start = node["auto_start"].as<bool>(false);

    if (node["endpoint_auth"] || node["endpoint_password"] || node["endpoint_key"]) {
        t.endpoint_auth = parse_auth(node, "endpoint_");
    }
    return t;
}

static HostConfig parse_host(const YAML::Node& node) {
    HostConfig h;
    h.name = node["name"].as<std::string>("");
    h.ip = node["ip"].as<std::string>("");
    h.port = node["port"].as<int>(SSH_DEFAULT_PORT);
    h.username = node["username"].as<std::string>("");
    h.auth = parse_auth(node, "");
    h.pin = node["pin"].as<bool>(false);

    if (node["tunnels"] && node["tunnels"].IsSequence()) {
        for (const auto& t : node["tunnels"]) {
            h.tunnels.push_back(parse_tunnel(t));
        }
    }
    return h;
}

class ConfigBuilder {
public:
    static Config from_node(const YAML::Node& root) {
        Config config;

        if (const auto& n = root["ssh"]) {
            config.ssh_.connect_timeout = n["connect_timeout"].as<int>(SSH_CONNECT_TIMEOUT_SECS);
            config.ssh_.keepalive_interval = n["keepalive_interval"].as<int>(SSH_KEEPALIVE_INTERVAL_SECS);
            config.ssh_.keepalive_max_missed = n["keepalive_max_missed"].as<int>(SSH_KEEPALIVE_MAX_MISSED);
        }
        if (const auto& n = root["retry"]) {
            config.retry_.max_backoff = n["max_backoff"].as<int>(config.retry_.max_backoff);
            config.retry_.monitor_interval = n["monitor_interval"].as<int>(MONITOR_INTERVAL_MS);
        }
        if (const auto& n = root["forward"]) {
            config.forward_.bind_address = n["bind_address"].as<std::string>(FORWARD_BIND_ADDRESS);
            config.forward_.endpoint_target = n["endpoint_target"].as<std::string>(FORWARD_ENDPOINT_TARGET);
        }
        if (const auto& n = root["sessions"]) {
            config.sessions_.duration_hours = n["duration_hours"].as<int>(SESSION_DURATION_HOURS);
            config.sessions_.max_inactivity_hours = n["max_inactivity_hours"].as<int>(SESSION_MAX_INACTIVITY_HOURS);
            config.sessions_.sweep_interval_minutes = n["sweep_interval_minutes"].as<int>(SESSION_SWEEP_INTERVAL_MINUTES);
            config.sessions_.kdf_iterations = n["kdf_iterations"].as<int>(KDF_ITERATIONS);
            config.sessions_.oidc_secret = n["oidc_secret"].as<std::string>("");
        }
        if (const auto& n = root["log"]) {
            config.log_path_ = n["path"].as<std::string>("");
        }
        if (root["hosts"] && root["hosts"].IsSequence()) {
            for (const auto& h : root["hosts"]) {
                config.hosts_.push_back(parse_host(h));
            }
        }
        return config;
    }
};

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) return Result<Config>::Ok(Config{});
        if (!root.IsMap()) return Result<Config>::Err("Config root must be a mapping");
        return Result<Config>::Ok(ConfigBuilder::from_node(root));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!config_exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) return Result<Config>::Ok(Config{});
        if (!root.IsMap()) return Result<Config>::Err("Config root must be a mapping");
        return Result<Config>::Ok(ConfigBuilder::from_node(root));
    } catch (const std::exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

std::string Config::oidc_secret() const {
    if (!sessions_.oidc_secret.empty()) return sessions_.oidc_secret;
    if (const char* env = std::getenv("TUNNELD_OIDC_SECRET")) {
        if (*env) return env;
    }
    return OIDC_DEFAULT_SECRET;
}
