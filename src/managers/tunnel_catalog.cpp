#include "tunnel_catalog.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fstream>
#include <sstream>

static std::string read_key_file(const std::string& path_str) {
    fs::path path = path_str;
    if (path_str.rfind("~/", 0) == 0) path = platform::home_dir() / path_str.substr(2);

    std::ifstream in(path);
    if (!in) {
        log_warn(fmt::format("Config: cannot read key file {}", path.string()));
        return "";
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

AuthMaterial auth_from_config(const AuthConfig& auth) {
    if (auth.type == "credential") {
        return CredentialRef{auth.credential_id, auth.user_id};
    }
    if (auth.type == "key") {
        KeyAuth k;
        k.private_key = !auth.key.empty() ? auth.key : (auth.key_file.empty() ? "" : read_key_file(auth.key_file));
        if (!auth.key_password.empty()) k.passphrase = auth.key_password;
        if (!auth.key_type.empty()) k.key_type = auth.key_type;
        return k;
    }
    return PasswordAuth{auth.password};
}

HostRef host_from_config(const HostConfig& host) {
    HostRef ref;
    ref.name = host.name;
    ref.address = host.ip;
    ref.port = host.port;
    ref.username = host.username;
    ref.auth = auth_from_config(host.auth);
    return ref;
}

std::vector<HostRef> hosts_from_config(const std::vector<HostConfig>& hosts) {
    std::vector<HostRef> out;
    out.reserve(hosts.size());
    for (const auto& h : hosts) out.push_back(host_from_config(h));
    return out;
}

std::vector<TunnelSpec> tunnel_specs_from_config(const std::vector<HostConfig>& hosts) {
    std::vector<TunnelSpec> specs;
    for (const auto& h : hosts) {
        HostRef source = host_from_config(h);
        std::string label = host_label(source);

        for (const auto& t : h.tunnels) {
            TunnelSpec spec;
            spec.name = tunnel_name(label, t.source_port, t.endpoint_port);
            spec.source = source;
            spec.endpoint_host = t.endpoint_host;
            if (t.endpoint_auth) spec.endpoint_auth_override = auth_from_config(*t.endpoint_auth);
            spec.source_port = t.source_port;
            spec.endpoint_port = t.endpoint_port;
            spec.max_retries = t.max_retries;
            spec.retry_interval_ms = int64_t(t.retry_interval) * 1000;
            spec.auto_start = t.auto_start;
            spec.is_pinned = h.pin;
            specs.push_back(std::move(spec));
        }
    }
    return specs;
}
