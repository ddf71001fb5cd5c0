#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <crypto/key_buffer.hpp>
#include <ssh/transport.hpp>
#include "credential_store.hpp"
#include "tunnel_types.hpp"

// Turns a configured host (inline auth or a credential reference) into a
// concrete SessionTarget. Credential references are decrypted with the
// owner's data key; a locked owner or missing record fails with
// CredentialUnavailable.
class CredentialResolver {
public:
    using DataKeyProvider = std::function<std::shared_ptr<const KeyBuffer>(const std::string& user_id)>;

    CredentialResolver(CredentialStore* store, DataKeyProvider data_key);

    // `override_auth` replaces the host's own auth material when set.
    Result<SessionTarget> resolve(const HostRef& host,
                                  const std::optional<AuthMaterial>& override_auth = std::nullopt) const;

private:
    CredentialStore* store_;
    DataKeyProvider data_key_;

    Result<void> apply(const AuthMaterial& auth, const HostRef& host, SessionTarget& target) const;
    Result<void> apply_credential(const CredentialRef& ref, const HostRef& host,
                                  SessionTarget& target) const;
};
