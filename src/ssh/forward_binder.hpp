#pragma once

#include <memory>
#include <core/types.hpp>
#include "forward_relay.hpp"
#include "transport.hpp"

class SshSession;

// A remote listener on the source host (tcpip-forward over the source
// session). Every connection the source server hands us is spliced to a
// direct-tcpip channel opened through the endpoint session.
//
// Both sessions must outlive the handle; the supervisor closes the handle
// before either session.
class SshForwardHandle : public ForwardHandle {
public:
    ~SshForwardHandle() override;

    SshForwardHandle(const SshForwardHandle&) = delete;
    SshForwardHandle& operator=(const SshForwardHandle&) = delete;

    // Fails with BindFailed when the remote port cannot be listened on.
    static Result<std::unique_ptr<ForwardHandle>> start(SshSession& source,
                                                        SshSession& endpoint,
                                                        const ForwardRequest& request);

    void close() override;
    bool is_alive() const override;
    int bound_port() const override { return bound_port_; }
    size_t active_connections() const override { return relay_->active_connections(); }

private:
    SshForwardHandle(SshSession& source, SshSession& endpoint, int bound_port,
                     std::unique_ptr<ForwardRelay> relay);

    SshSession& source_;
    SshSession& endpoint_;
    int bound_port_;
    std::unique_ptr<ForwardRelay> relay_;
};
