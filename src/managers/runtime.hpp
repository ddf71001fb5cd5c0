#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <crypto/key_store.hpp>
#include <crypto/user_crypto.hpp>
#include <ssh/transport.hpp>
#include "credential_resolver.hpp"
#include "credential_store.hpp"
#include "host_directory.hpp"
#include "tunnel_service.hpp"
#include "tunnel_types.hpp"

struct RuntimePaths {
    fs::path keys = YamlKeyStore::default_path();
    fs::path credentials = YamlCredentialStore::default_path();
};

// Headless facade: owns the stores, the crypto session manager, the host
// directory and the tunnel service, wired from one Config. Any frontend
// (REPL, headless daemon, tests) drives tunneld through this.
class TunneldRuntime {
public:
    // `transport` defaults to libssh2.
    TunneldRuntime(const Config& config, RuntimePaths paths = {},
                   std::unique_ptr<SshTransport> transport = nullptr);
    ~TunneldRuntime();

    TunneldRuntime(const TunneldRuntime&) = delete;
    TunneldRuntime& operator=(const TunneldRuntime&) = delete;

    // Start the session sweeper and schedule auto-start tunnels.
    void start();

    // Stop tunnels (listener first), autostart and the sweeper.
    void shutdown();

    // ── Tunnels ───────────────────────────────────────────────

    const std::vector<TunnelSpec>& specs() const { return specs_; }
    std::optional<TunnelSpec> find_spec(const std::string& name) const;

    Result<TunnelStatus> connect(const std::string& name);
    TunnelService& tunnels() { return *service_; }

    // ── Users ─────────────────────────────────────────────────

    UserCryptoManager& crypto() { return *crypto_; }
    CredentialStore& credentials() { return *credential_store_; }

    // Encrypt and store a credential for an unlocked user.
    Result<void> add_credential(const PlainCredential& plain);

    const Config& config() const { return config_; }

private:
    Config config_;
    std::unique_ptr<KeyStore> key_store_;
    std::unique_ptr<CredentialStore> credential_store_;
    std::unique_ptr<UserCryptoManager> crypto_;
    std::unique_ptr<StaticHostDirectory> hosts_;
    std::unique_ptr<CredentialResolver> resolver_;
    std::unique_ptr<SshTransport> transport_;
    std::unique_ptr<TunnelService> service_;
    std::vector<TunnelSpec> specs_;
    bool started_ = false;
};

// Map config sections onto component options.
SupervisorOptions supervisor_options(const Config& config);
UserCryptoOptions crypto_options(const Config& config);
