#pragma once

#include "transport.hpp"

// Production transport: libssh2 sessions and remote-listener forwards.
class Libssh2Transport : public SshTransport {
public:
    Result<std::shared_ptr<SshLink>> open(const SessionTarget& target,
                                          const std::atomic<bool>& cancelled) override;

    Result<std::unique_ptr<ForwardHandle>> bind(SshLink& source,
                                                SshLink& endpoint,
                                                const ForwardRequest& request) override;
};
