#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>

enum class AuthMethod {
    Password,
    Key,
};

// Concrete connection parameters for one SSH hop. Holds plaintext secrets
// for the duration of a single open() call; callers wipe() it afterwards.
struct SessionTarget {
    std::string host;
    int port = SSH_DEFAULT_PORT;
    std::string user;
    AuthMethod method = AuthMethod::Password;
    std::string password;
    std::string private_key;
    std::string passphrase;
    int timeout = SSH_CONNECT_TIMEOUT_SECS;
    int keepalive_interval = SSH_KEEPALIVE_INTERVAL_SECS;
    int keepalive_max_missed = SSH_KEEPALIVE_MAX_MISSED;

    std::string label() const { return user + "@" + host + ":" + std::to_string(port); }

    // Zero the secret fields in place.
    void wipe();
};

// One authenticated SSH transport to a single host.
class SshLink {
public:
    virtual ~SshLink() = default;

    // Keepalive probe. Returns false once the link is considered dead
    // (socket error, or keepalive_max_missed consecutive failed probes).
    virtual bool check_alive() = 0;
    virtual bool is_active() const = 0;
    virtual void close() = 0;

    virtual const std::string& get_target() const = 0;
    virtual std::string last_error() const = 0;
};

// A bound port forward. close() stops accepting first, then tears down
// every spliced connection.
class ForwardHandle {
public:
    virtual ~ForwardHandle() = default;

    virtual void close() = 0;
    virtual bool is_alive() const = 0;
    virtual int bound_port() const = 0;
    virtual size_t active_connections() const = 0;
};

struct ForwardRequest {
    int source_port = 0;
    std::string bind_address = FORWARD_BIND_ADDRESS;
    std::string endpoint_host = FORWARD_ENDPOINT_TARGET;
    int endpoint_port = 0;
};

// Seam between the supervisor and the network: opens SSH links and binds
// forwards between two of them.
class SshTransport {
public:
    virtual ~SshTransport() = default;

    // Fails with AuthenticationFailed, NetworkUnreachable, Timeout or
    // AlgorithmMismatch. Returns promptly once `cancelled` is set.
    virtual Result<std::shared_ptr<SshLink>> open(const SessionTarget& target,
                                                  const std::atomic<bool>& cancelled) = 0;

    // Fails with BindFailed.
    virtual Result<std::unique_ptr<ForwardHandle>> bind(SshLink& source,
                                                        SshLink& endpoint,
                                                        const ForwardRequest& request) = 0;
};
