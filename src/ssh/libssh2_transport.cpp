#include "libssh2_transport.hpp"
#include "forward_binder.hpp"
#include "session.hpp"

Result<std::shared_ptr<SshLink>> Libssh2Transport::open(const SessionTarget& target,
                                                        const std::atomic<bool>& cancelled) {
    auto session = std::make_shared<SshSession>(target);
    auto r = session->establish(cancelled);
    if (r.is_err()) {
        return Result<std::shared_ptr<SshLink>>::Err(r.error, r.kind);
    }
    return Result<std::shared_ptr<SshLink>>::Ok(session);
}

Result<std::unique_ptr<ForwardHandle>> Libssh2Transport::bind(SshLink& source,
                                                              SshLink& endpoint,
                                                              const ForwardRequest& request) {
    auto* src = dynamic_cast<SshSession*>(&source);
    auto* dst = dynamic_cast<SshSession*>(&endpoint);
    if (!src || !dst) {
        return Result<std::unique_ptr<ForwardHandle>>::Err(
            "Port forwarding failed: link was not opened by this transport",
            ErrorType::BindFailed);
    }
    return SshForwardHandle::start(*src, *dst, request);
}
