#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <ssh/transport.hpp>
#include "credential_resolver.hpp"
#include "host_directory.hpp"
#include "tunnel_types.hpp"

struct SupervisorOptions {
    int connect_timeout = SSH_CONNECT_TIMEOUT_SECS;
    int keepalive_interval = SSH_KEEPALIVE_INTERVAL_SECS;
    int keepalive_max_missed = SSH_KEEPALIVE_MAX_MISSED;
    int64_t max_backoff_ms = RETRY_MAX_BACKOFF_MS;
    int monitor_interval_ms = MONITOR_INTERVAL_MS;
    std::string bind_address = FORWARD_BIND_ADDRESS;
    std::string endpoint_target = FORWARD_ENDPOINT_TARGET;
};

// Owns one tunnel's lifecycle on a dedicated worker thread:
//
//   Connecting -> Connected -> (drop) -> Retrying -> Waiting -> Connecting ...
//                           -> Failed once retry_count > max_retries
//
// stop() interrupts the backoff wait or in-flight attempt, tears the tunnel
// down (listener before sessions) and ends in Disconnected.
//
// The listener is called on every transition, in order, from whichever
// thread made it. It must not call start() or stop() on the same supervisor.
class Supervisor {
public:
    Supervisor(std::string name, SshTransport& transport, const CredentialResolver& resolver,
               const HostDirectory* hosts, SupervisorOptions options, StatusListener listener);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // Begin a fresh attempt cycle. Returns false (and does nothing) unless
    // the tunnel is Disconnected or Failed.
    bool start(const TunnelSpec& spec);

    // Blocks until the worker has exited. Returns the final status.
    TunnelStatus stop();

    // Never blocks on network I/O.
    TunnelStatus status() const;

    const std::string& name() const { return name_; }

private:
    std::string name_;
    SshTransport& transport_;
    const CredentialResolver& resolver_;
    const HostDirectory* hosts_;
    SupervisorOptions options_;
    StatusListener listener_;

    TunnelSpec spec_;

    mutable std::mutex status_mutex_;
    TunnelStatus status_;
    std::mutex publish_mutex_;      // orders status updates with listener calls
    std::mutex lifecycle_mutex_;    // serializes start/stop

    std::atomic<bool> stop_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::thread worker_;

    // Touched only by the worker thread
    std::shared_ptr<SshLink> source_;
    std::shared_ptr<SshLink> endpoint_;
    std::unique_ptr<ForwardHandle> forward_;

    void run();
    Result<void> attempt();
    Result<std::shared_ptr<SshLink>> open_link(const HostRef& host,
                                               const std::optional<AuthMaterial>& override_auth,
                                               const char* role);
    Result<void> monitor();
    Result<void> probe();
    void teardown();
    bool wait_retry(int64_t delay_ms, TunnelStatus waiting);
    void wake();

    TunnelStatus make_status(TunnelState state, int retry_count) const;
    void publish(const TunnelStatus& st, bool from_worker);
};
