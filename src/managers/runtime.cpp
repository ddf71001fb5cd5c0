#include "runtime.hpp"
#include "tunnel_catalog.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <ssh/libssh2_transport.hpp>

SupervisorOptions supervisor_options(const Config& config) {
    SupervisorOptions o;
    o.connect_timeout = config.ssh().connect_timeout;
    o.keepalive_interval = config.ssh().keepalive_interval;
    o.keepalive_max_missed = config.ssh().keepalive_max_missed;
    o.max_backoff_ms = int64_t(config.retry().max_backoff) * 1000;
    o.monitor_interval_ms = config.retry().monitor_interval;
    o.bind_address = config.forward().bind_address;
    o.endpoint_target = config.forward().endpoint_target;
    return o;
}

UserCryptoOptions crypto_options(const Config& config) {
    UserCryptoOptions o;
    o.session_duration_ms = int64_t(config.sessions().duration_hours) * 3600 * 1000;
    o.max_inactivity_ms = int64_t(config.sessions().max_inactivity_hours) * 3600 * 1000;
    o.sweep_interval_ms = int64_t(config.sessions().sweep_interval_minutes) * 60 * 1000;
    o.kdf_iterations = config.sessions().kdf_iterations;
    o.oidc_secret = config.oidc_secret();
    return o;
}

TunneldRuntime::TunneldRuntime(const Config& config, RuntimePaths paths,
                               std::unique_ptr<SshTransport> transport)
    : config_(config) {
    key_store_ = std::make_unique<YamlKeyStore>(paths.keys);
    credential_store_ = std::make_unique<YamlCredentialStore>(paths.credentials);
    crypto_ = std::make_unique<UserCryptoManager>(*key_store_, crypto_options(config_));
    hosts_ = std::make_unique<StaticHostDirectory>(hosts_from_config(config_.hosts()));

    UserCryptoManager* crypto = crypto_.get();
    resolver_ = std::make_unique<CredentialResolver>(
        credential_store_.get(),
        [crypto](const std::string& user_id) { return crypto->get_user_data_key(user_id); });

    transport_ = transport ? std::move(transport) : std::make_unique<Libssh2Transport>();
    service_ = std::make_unique<TunnelService>(*transport_, *resolver_, hosts_.get(),
                                               supervisor_options(config_));
    specs_ = tunnel_specs_from_config(config_.hosts());

    crypto_->set_session_expired_callback([](const std::string& user_id) {
        log_info(fmt::format("Runtime: data key for {} locked after expiry", user_id));
    });
}

TunneldRuntime::~TunneldRuntime() {
    shutdown();
}

void TunneldRuntime::start() {
    if (started_) return;
    started_ = true;
    crypto_->start_sweeper();
    service_->autostart(specs_);
    log_info(fmt::format("Runtime: started with {} host(s), {} tunnel(s)",
                         config_.hosts().size(), specs_.size()));
}

void TunneldRuntime::shutdown() {
    if (service_) service_->shutdown();
    if (crypto_) crypto_->stop_sweeper();
}

std::optional<TunnelSpec> TunneldRuntime::find_spec(const std::string& name) const {
    for (const auto& s : specs_) {
        if (s.name == name) return s;
    }
    return std::nullopt;
}

Result<TunnelStatus> TunneldRuntime::connect(const std::string& name) {
    auto spec = find_spec(name);
    if (!spec) return Result<TunnelStatus>::Err("No configured tunnel named " + name);
    return service_->connect(*spec);
}

Result<void> TunneldRuntime::add_credential(const PlainCredential& plain) {
    auto dek = crypto_->get_user_data_key(plain.owner_user_id);
    if (!dek) {
        return Result<void>::Err("User " + plain.owner_user_id + " is locked; log in first",
                                 ErrorType::CredentialUnavailable);
    }
    auto rec = seal_credential(plain, *dek);
    if (rec.is_err()) return Result<void>::Err(rec.error);
    return credential_store_->save(rec.value);
}
