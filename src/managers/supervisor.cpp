#include "supervisor.hpp"
#include "backoff.hpp"
#include <core/error_classifier.hpp>
#include <core/log.hpp>
#include <chrono>
#include <fmt/format.h>

using Clock = std::chrono::steady_clock;

// Prefer the kind the failing layer reported; fall back to the message.
static ErrorType effective_kind(const Result<void>& r) {
    if (r.kind != ErrorType::Unknown && r.kind != ErrorType::None) return r.kind;
    return classify_error_message(r.error);
}

Supervisor::Supervisor(std::string name, SshTransport& transport,
                       const CredentialResolver& resolver, const HostDirectory* hosts,
                       SupervisorOptions options, StatusListener listener)
    : name_(std::move(name)), transport_(transport), resolver_(resolver), hosts_(hosts),
      options_(std::move(options)), listener_(std::move(listener)) {
}

Supervisor::~Supervisor() {
    stop_ = true;
    wake();
    if (worker_.joinable()) worker_.join();
}

// ── Status ────────────────────────────────────────────────

TunnelStatus Supervisor::status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return status_;
}

TunnelStatus Supervisor::make_status(TunnelState state, int retry_count) const {
    TunnelStatus st;
    st.state = state;
    st.retry_count = retry_count;
    st.max_retries = spec_.max_retries;
    return st;
}

void Supervisor::publish(const TunnelStatus& st, bool from_worker) {
    std::lock_guard<std::mutex> pub(publish_mutex_);
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        // Once stop() has announced Disconnecting, the worker is silent
        if (from_worker && stop_.load()) return;
        status_ = st;
    }
    if (st.state != TunnelState::Waiting) {
        tunneld_log(fmt::format("Tunnel {}: {}{}", name_, tunnel_state_name(st.state),
                                st.reason ? " (" + *st.reason + ")" : ""));
    }
    if (listener_) listener_(name_, st);
}

void Supervisor::wake() {
    // Taking the wait mutex orders the flag store before any waiter's
    // predicate check, so the notify cannot be lost.
    { std::lock_guard<std::mutex> lock(wait_mutex_); }
    wait_cv_.notify_all();
}

// ── Lifecycle ─────────────────────────────────────────────

bool Supervisor::start(const TunnelSpec& spec) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!is_idle_state(status().state)) return false;

    // A previous cycle that ended in Failed leaves a finished worker behind
    if (worker_.joinable()) worker_.join();

    spec_ = spec;
    stop_ = false;
    publish(make_status(TunnelState::Connecting, 0), false);
    worker_ = std::thread(&Supervisor::run, this);
    return true;
}

TunnelStatus Supervisor::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    TunnelStatus current = status();
    if (current.state == TunnelState::Disconnected && !worker_.joinable()) {
        return current;
    }

    {
        std::lock_guard<std::mutex> pub(publish_mutex_);
        stop_ = true;
    }
    if (!is_idle_state(current.state)) {
        TunnelStatus st = current;
        st.state = TunnelState::Disconnecting;
        st.next_retry_in_seconds.reset();
        publish(st, false);
    }

    wake();
    if (worker_.joinable()) worker_.join();

    TunnelStatus done = make_status(TunnelState::Disconnected, 0);
    done.manual_disconnect = true;
    publish(done, false);
    return done;
}

// ── Worker ────────────────────────────────────────────────

void Supervisor::run() {
    int retry_count = 0;
    bool first = true;

    while (!stop_.load()) {
        if (!first) publish(make_status(TunnelState::Connecting, retry_count), true);
        first = false;

        Result<void> r = attempt();
        if (stop_.load()) break;

        if (r.is_ok()) {
            retry_count = 0;
            publish(make_status(TunnelState::Connected, 0), true);
            r = monitor();
            if (stop_.load()) break;
            log_warn(fmt::format("Tunnel {}: connection lost: {}", name_, r.error));
        }
        teardown();

        ErrorType kind = effective_kind(r);
        retry_count++;

        if (retry_count > spec_.max_retries) {
            TunnelStatus st = make_status(TunnelState::Failed, retry_count);
            st.reason = r.error;
            st.error_type = kind;
            st.retry_exhausted = true;
            publish(st, true);
            break;
        }

        TunnelStatus st = make_status(TunnelState::Retrying, retry_count);
        st.reason = r.error;
        st.error_type = kind;
        publish(st, true);

        int64_t delay = backoff_delay_ms(spec_.retry_interval_ms, retry_count, options_.max_backoff_ms);
        if (!wait_retry(delay, st)) break;
    }

    teardown();
}

// Waiting countdown, republished once per second. False when stopped.
bool Supervisor::wait_retry(int64_t delay_ms, TunnelStatus waiting) {
    waiting.state = TunnelState::Waiting;
    auto deadline = Clock::now() + std::chrono::milliseconds(delay_ms);

    std::unique_lock<std::mutex> lk(wait_mutex_);
    while (!stop_.load()) {
        auto now = Clock::now();
        if (now >= deadline) return true;

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int secs = static_cast<int>((left.count() + 999) / 1000);
        waiting.next_retry_in_seconds = secs;

        lk.unlock();
        publish(waiting, true);
        lk.lock();

        auto step = left - std::chrono::milliseconds(int64_t(secs - 1) * 1000);
        wait_cv_.wait_for(lk, step, [this]() { return stop_.load(); });
    }
    return false;
}

Result<std::shared_ptr<SshLink>> Supervisor::open_link(const HostRef& host,
                                                       const std::optional<AuthMaterial>& override_auth,
                                                       const char* role) {
    using R = Result<std::shared_ptr<SshLink>>;

    auto target = resolver_.resolve(host, override_auth);
    if (target.is_err()) {
        return R::Err(fmt::format("{} host {}: {}", role, host_label(host), target.error), target.kind);
    }

    SessionTarget t = std::move(target.value);
    t.timeout = options_.connect_timeout;
    t.keepalive_interval = options_.keepalive_interval;
    t.keepalive_max_missed = options_.keepalive_max_missed;

    auto link = transport_.open(t, stop_);
    t.wipe();
    if (link.is_err()) {
        return R::Err(fmt::format("{} host {}: {}", role, host_label(host), link.error), link.kind);
    }
    return link;
}

Result<void> Supervisor::attempt() {
    // The endpoint is looked up on every attempt so a host added while
    // retries are pending is picked up.
    std::optional<HostRef> endpoint_host = spec_.endpoint;
    if (!endpoint_host && hosts_) endpoint_host = hosts_->find(spec_.endpoint_host);
    if (!endpoint_host) {
        return Result<void>::Err(fmt::format("Endpoint host '{}' not found", spec_.endpoint_host),
                                 ErrorType::EndpointHostNotFound);
    }

    auto src = open_link(spec_.source, std::nullopt, "Source");
    if (src.is_err()) return Result<void>::Err(src.error, src.kind);
    source_ = src.value;

    if (stop_.load()) return Result<void>::Err("Connection attempt cancelled");

    auto dst = open_link(*endpoint_host, spec_.endpoint_auth_override, "Endpoint");
    if (dst.is_err()) return Result<void>::Err(dst.error, dst.kind);
    endpoint_ = dst.value;

    if (stop_.load()) return Result<void>::Err("Connection attempt cancelled");

    ForwardRequest req;
    req.source_port = spec_.source_port;
    req.bind_address = options_.bind_address;
    req.endpoint_host = options_.endpoint_target;
    req.endpoint_port = spec_.endpoint_port;

    auto fwd = transport_.bind(*source_, *endpoint_, req);
    if (fwd.is_err()) {
        return Result<void>::Err(fwd.error,
                                 fwd.kind == ErrorType::Unknown ? ErrorType::BindFailed : fwd.kind);
    }
    forward_ = std::move(fwd.value);
    return Result<void>::Ok();
}

// ── Connected ─────────────────────────────────────────────

Result<void> Supervisor::probe() {
    auto dropped = [](SshLink& link) {
        std::string reason = link.last_error();
        if (reason.empty()) reason = "Connection closed unexpectedly";
        ErrorType kind = classify_error_message(reason);
        if (kind == ErrorType::Unknown) kind = ErrorType::NetworkUnreachable;
        return Result<void>::Err(fmt::format("{}: {}", link.get_target(), reason), kind);
    };

    if (!source_->check_alive()) return dropped(*source_);
    if (!endpoint_->check_alive()) return dropped(*endpoint_);
    if (!forward_->is_alive()) {
        return Result<void>::Err("Port forward listener closed unexpectedly",
                                 ErrorType::NetworkUnreachable);
    }
    return Result<void>::Ok();
}

// Returns Ok only when stopped; an Err is an unexpected drop.
Result<void> Supervisor::monitor() {
    std::unique_lock<std::mutex> lk(wait_mutex_);
    while (!stop_.load()) {
        wait_cv_.wait_for(lk, std::chrono::milliseconds(options_.monitor_interval_ms),
                          [this]() { return stop_.load(); });
        if (stop_.load()) break;

        lk.unlock();
        auto r = probe();
        lk.lock();
        if (r.is_err()) return r;
    }
    return Result<void>::Ok();
}

void Supervisor::teardown() {
    // Listener first: no new clients once teardown begins
    if (forward_) {
        forward_->close();
        forward_.reset();
    }
    if (source_) {
        source_->close();
        source_.reset();
    }
    if (endpoint_) {
        endpoint_->close();
        endpoint_.reset();
    }
}
