#pragma once

#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>
#include <ssh/transport.hpp>
#include "credential_resolver.hpp"
#include "host_directory.hpp"
#include "supervisor.hpp"
#include "tunnel_registry.hpp"
#include "tunnel_types.hpp"

// Control surface for tunnels. Every operation returns promptly except
// disconnect/cancel, which wait for the supervisor's worker to stop.
class TunnelService {
public:
    TunnelService(SshTransport& transport, const CredentialResolver& resolver,
                  const HostDirectory* hosts, SupervisorOptions options = {});
    ~TunnelService();

    TunnelService(const TunnelService&) = delete;
    TunnelService& operator=(const TunnelService&) = delete;

    void set_status_listener(StatusListener listener);

    // Starts an attempt cycle. While the tunnel is already active this is a
    // no-op that returns the current status.
    Result<TunnelStatus> connect(const TunnelSpec& spec);

    Result<TunnelStatus> disconnect(const std::string& name);
    Result<TunnelStatus> cancel(const std::string& name);

    std::optional<TunnelStatus> get_status(const std::string& name) const;
    std::map<std::string, TunnelStatus> get_all_statuses() const;

    // After delay_ms, connect every spec with auto_start set.
    void autostart(std::vector<TunnelSpec> specs, int delay_ms = AUTOSTART_DELAY_MS);

    // Stop autostart and every supervisor; the registry ends empty. Waits
    // for connects already past the shutdown check to register first.
    void shutdown();

private:
    SshTransport& transport_;
    const CredentialResolver& resolver_;
    const HostDirectory* hosts_;
    SupervisorOptions options_;
    TunnelRegistry registry_;

    std::mutex listener_mutex_;
    StatusListener listener_;

    std::thread autostart_thread_;
    std::mutex autostart_mutex_;
    std::condition_variable autostart_cv_;
    bool shutting_down_ = false;
    int connects_in_flight_ = 0;      // guarded by autostart_mutex_

    Result<TunnelStatus> stop_tunnel(const std::string& name, const char* op);
    void notify(const std::string& name, const TunnelStatus& status);
};
