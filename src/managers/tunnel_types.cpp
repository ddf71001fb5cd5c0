#include "tunnel_types.hpp"
#include <fmt/format.h>

std::string host_label(const HostRef& host) {
    if (!host.name.empty()) return host.name;
    return host.username + "@" + host.address;
}

std::string tunnel_name(const std::string& label, int source_port, int endpoint_port) {
    return fmt::format("{}_{}_{}", label, source_port, endpoint_port);
}

static bool valid_port(int port) {
    return port >= 1 && port <= 65535;
}

Result<void> validate_spec(const TunnelSpec& spec) {
    if (spec.name.empty()) {
        return Result<void>::Err("Tunnel name required");
    }
    if (spec.source.address.empty() || spec.source.username.empty() ||
        !valid_port(spec.source.port)) {
        return Result<void>::Err("Missing required connection details");
    }
    if (!valid_port(spec.source_port)) {
        return Result<void>::Err(fmt::format("Source port {} out of range", spec.source_port));
    }
    if (!valid_port(spec.endpoint_port)) {
        return Result<void>::Err(fmt::format("Endpoint port {} out of range", spec.endpoint_port));
    }
    if (spec.max_retries < 0) {
        return Result<void>::Err("max_retries must be non-negative");
    }
    if (spec.retry_interval_ms < 0) {
        return Result<void>::Err("retry interval must be non-negative");
    }
    if (!spec.endpoint && spec.endpoint_host.empty()) {
        return Result<void>::Err("Endpoint host required");
    }
    std::string expected = tunnel_name(host_label(spec.source), spec.source_port, spec.endpoint_port);
    if (spec.name != expected) {
        return Result<void>::Err(fmt::format("Tunnel name '{}' does not match '{}'", spec.name, expected));
    }
    return Result<void>::Ok();
}

const char* tunnel_state_name(TunnelState state) {
    switch (state) {
        case TunnelState::Disconnected:  return "DISCONNECTED";
        case TunnelState::Connecting:    return "CONNECTING";
        case TunnelState::Connected:     return "CONNECTED";
        case TunnelState::Retrying:      return "RETRYING";
        case TunnelState::Waiting:       return "WAITING";
        case TunnelState::Disconnecting: return "DISCONNECTING";
        case TunnelState::Failed:        return "FAILED";
    }
    return "UNKNOWN";
}
