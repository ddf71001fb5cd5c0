#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>
#include "tunnel_types.hpp"

// Translation from configured hosts to runtime host references and tunnel
// specs. Endpoints are left as labels so they are looked up per attempt.

AuthMaterial auth_from_config(const AuthConfig& auth);
HostRef host_from_config(const HostConfig& host);
std::vector<HostRef> hosts_from_config(const std::vector<HostConfig>& hosts);

// Every tunnel connection of every host, named "{hostLabel}_{src}_{dst}".
std::vector<TunnelSpec> tunnel_specs_from_config(const std::vector<HostConfig>& hosts);
