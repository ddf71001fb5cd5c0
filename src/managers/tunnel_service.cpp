#include "tunnel_service.hpp"
#include <core/log.hpp>
#include <chrono>
#include <fmt/format.h>

TunnelService::TunnelService(SshTransport& transport, const CredentialResolver& resolver,
                             const HostDirectory* hosts, SupervisorOptions options)
    : transport_(transport), resolver_(resolver), hosts_(hosts), options_(std::move(options)) {
}

TunnelService::~TunnelService() {
    shutdown();
}

void TunnelService::set_status_listener(StatusListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

void TunnelService::notify(const std::string& name, const TunnelStatus& status) {
    StatusListener cb;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        cb = listener_;
    }
    if (cb) cb(name, status);
}

Result<TunnelStatus> TunnelService::connect(const TunnelSpec& spec) {
    auto valid = validate_spec(spec);
    if (valid.is_err()) return Result<TunnelStatus>::Err(valid.error);

    {
        std::lock_guard<std::mutex> lock(autostart_mutex_);
        if (shutting_down_) return Result<TunnelStatus>::Err("Service is shutting down");
        connects_in_flight_++;
    }
    struct InFlight {
        TunnelService& svc;
        ~InFlight() {
            {
                std::lock_guard<std::mutex> lock(svc.autostart_mutex_);
                svc.connects_in_flight_--;
            }
            svc.autostart_cv_.notify_all();
        }
    } in_flight{*this};

    auto op = registry_.op_lock(spec.name);
    std::lock_guard<std::mutex> guard(*op);

    auto sup = registry_.get_or_create(spec.name, [&]() {
        return std::make_shared<Supervisor>(
            spec.name, transport_, resolver_, hosts_, options_,
            [this](const std::string& name, const TunnelStatus& st) { notify(name, st); });
    });

    if (!sup->start(spec)) {
        tunneld_log(fmt::format("Tunnel {}: connect ignored, already {}", spec.name,
                                tunnel_state_name(sup->status().state)));
    }
    return Result<TunnelStatus>::Ok(sup->status());
}

Result<TunnelStatus> TunnelService::stop_tunnel(const std::string& name, const char* op) {
    auto lock = registry_.op_lock(name);
    std::lock_guard<std::mutex> guard(*lock);

    auto sup = registry_.find(name);
    if (!sup) {
        // Unknown or already removed: nothing to do
        return Result<TunnelStatus>::Ok(TunnelStatus{});
    }

    log_info(fmt::format("Tunnel {}: {} requested in state {}", name, op,
                         tunnel_state_name(sup->status().state)));
    TunnelStatus final_status = sup->stop();
    registry_.remove(name);
    return Result<TunnelStatus>::Ok(final_status);
}

Result<TunnelStatus> TunnelService::disconnect(const std::string& name) {
    return stop_tunnel(name, "disconnect");
}

Result<TunnelStatus> TunnelService::cancel(const std::string& name) {
    return stop_tunnel(name, "cancel");
}

std::optional<TunnelStatus> TunnelService::get_status(const std::string& name) const {
    auto sup = registry_.find(name);
    if (!sup) return std::nullopt;
    return sup->status();
}

std::map<std::string, TunnelStatus> TunnelService::get_all_statuses() const {
    std::map<std::string, TunnelStatus> out;
    for (const auto& sup : registry_.snapshot()) {
        out[sup->name()] = sup->status();
    }
    return out;
}

void TunnelService::autostart(std::vector<TunnelSpec> specs, int delay_ms) {
    std::lock_guard<std::mutex> lock(autostart_mutex_);
    if (shutting_down_ || autostart_thread_.joinable()) return;

    autostart_thread_ = std::thread([this, specs = std::move(specs), delay_ms]() {
        {
            std::unique_lock<std::mutex> lk(autostart_mutex_);
            autostart_cv_.wait_for(lk, std::chrono::milliseconds(delay_ms),
                                   [this]() { return shutting_down_; });
            if (shutting_down_) return;
        }

        int started = 0;
        for (const auto& spec : specs) {
            if (!spec.auto_start) continue;
            auto r = connect(spec);
            if (r.is_err()) {
                log_warn(fmt::format("Autostart: skipping {}: {}", spec.name, r.error));
                continue;
            }
            started++;
        }
        log_info(fmt::format("Autostart: {} tunnel(s) started", started));
    });
}

void TunnelService::shutdown() {
    {
        std::lock_guard<std::mutex> lock(autostart_mutex_);
        shutting_down_ = true;
    }
    autostart_cv_.notify_all();
    if (autostart_thread_.joinable()) autostart_thread_.join();

    {
        std::unique_lock<std::mutex> lk(autostart_mutex_);
        autostart_cv_.wait(lk, [this]() { return connects_in_flight_ == 0; });
    }

    for (const auto& sup : registry_.snapshot()) {
        auto r = stop_tunnel(sup->name(), "shutdown");
        if (r.is_err()) log_warn(fmt::format("Shutdown: {}: {}", sup->name(), r.error));
    }
}
