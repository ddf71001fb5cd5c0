#include "forward_binder.hpp"
#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <chrono>
#include <fmt/format.h>
#include <libssh2.h>

using Clock = std::chrono::steady_clock;

// Wait until the session socket is readable or `ms` elapses.
static void wait_readable(SshSession& s, int ms) {
    int sock = s.get_socket();
    if (sock < 0) {
        platform::sleep_ms(ms);
        return;
    }
    platform::poll_socket(sock, POLLIN, ms);
}

// ── Channel ───────────────────────────────────────────────

// A libssh2 channel on one session. Every call holds the session's io mutex.
class Libssh2Channel : public ChannelEnd {
public:
    Libssh2Channel(SshSession& session, LIBSSH2_CHANNEL* channel)
        : session_(session), channel_(channel) {}
    ~Libssh2Channel() override { close(); }

    Io read(char* buf, size_t size) override {
        ssize_t n;
        bool eof = false;
        {
            std::lock_guard<std::mutex> lock(*session_.io_mutex());
            n = libssh2_channel_read(channel_, buf, size);
            if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) eof = libssh2_channel_eof(channel_) != 0;
        }
        if (n > 0) return {Status::Data, static_cast<size_t>(n)};
        if ((n == 0 || n == LIBSSH2_ERROR_EAGAIN) && !eof) return {Status::Again, 0};
        return {Status::Closed, 0};
    }

    Io write(const char* buf, size_t size) override {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*session_.io_mutex());
            w = libssh2_channel_write(channel_, buf, size);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) return {Status::Again, 0};
        if (w < 0) return {Status::Closed, 0};
        return {Status::Data, static_cast<size_t>(w)};
    }

    void wait(int ms) override { wait_readable(session_, ms); }

    // Close and free under the session mutex. Bounded so a dead session
    // cannot wedge teardown.
    void close() override {
        if (!channel_) return;
        auto mtx = session_.io_mutex();
        auto deadline = Clock::now() + std::chrono::seconds(2);

        int rc;
        do {
            std::lock_guard<std::mutex> lock(*mtx);
            rc = libssh2_channel_close(channel_);
        } while (rc == LIBSSH2_ERROR_EAGAIN && Clock::now() < deadline && session_.is_active());

        do {
            std::lock_guard<std::mutex> lock(*mtx);
            rc = libssh2_channel_free(channel_);
        } while (rc == LIBSSH2_ERROR_EAGAIN && Clock::now() < deadline && session_.is_active());
        channel_ = nullptr;
    }

private:
    SshSession& session_;
    LIBSSH2_CHANNEL* channel_;
};

// ── Listener ──────────────────────────────────────────────

class Libssh2Listener : public ForwardListener {
public:
    Libssh2Listener(SshSession& source, LIBSSH2_LISTENER* listener)
        : source_(source), listener_(listener) {}
    ~Libssh2Listener() override { cancel(); }

    Accepted accept() override {
        if (!listener_) return {Status::Failed, nullptr, "listener cancelled"};
        LIBSSH2_CHANNEL* ch;
        int err = 0;
        {
            std::lock_guard<std::mutex> lock(*source_.io_mutex());
            ch = libssh2_channel_forward_accept(listener_);
            if (!ch) err = libssh2_session_last_errno(source_.get_raw_session());
        }
        if (ch) return {Status::Accepted, std::make_unique<Libssh2Channel>(source_, ch), ""};
        if (err == LIBSSH2_ERROR_EAGAIN) return {Status::Again, nullptr, ""};
        return {Status::Failed, nullptr, fmt::format("{} (error {})", source_.get_target(), err)};
    }

    void wait(int ms) override { wait_readable(source_, ms); }

    void cancel() override {
        if (!listener_) return;
        auto mtx = source_.io_mutex();
        auto deadline = Clock::now() + std::chrono::seconds(2);
        int rc;
        do {
            std::lock_guard<std::mutex> lock(*mtx);
            rc = libssh2_channel_forward_cancel(listener_);
        } while (rc == LIBSSH2_ERROR_EAGAIN && Clock::now() < deadline && source_.is_active());
        listener_ = nullptr;
    }

private:
    SshSession& source_;
    LIBSSH2_LISTENER* listener_;
};

// direct-tcpip through the endpoint session, retried on EAGAIN until the
// channel-open timeout or stop.
static std::unique_ptr<ChannelEnd> open_direct_tcpip(SshSession& endpoint,
                                                     const ForwardRequest& request,
                                                     int bound_port,
                                                     const std::atomic<bool>& stop) {
    auto mtx = endpoint.io_mutex();
    auto deadline = Clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_TIMEOUT_SECS);

    while (!stop.load()) {
        LIBSSH2_CHANNEL* ch;
        int err = 0;
        {
            std::lock_guard<std::mutex> lock(*mtx);
            ch = libssh2_channel_direct_tcpip_ex(endpoint.get_raw_session(),
                                                 request.endpoint_host.c_str(),
                                                 request.endpoint_port,
                                                 "127.0.0.1", bound_port);
            if (!ch) err = libssh2_session_last_errno(endpoint.get_raw_session());
        }
        if (ch) return std::make_unique<Libssh2Channel>(endpoint, ch);
        if (err != LIBSSH2_ERROR_EAGAIN || Clock::now() >= deadline) {
            log_warn(fmt::format("ForwardBinder: direct-tcpip to {}:{} via {} failed (error {})",
                                 request.endpoint_host, request.endpoint_port,
                                 endpoint.get_target(), err));
            return nullptr;
        }
        wait_readable(endpoint, 10);
    }
    return nullptr;
}

// ── SshForwardHandle ──────────────────────────────────────

SshForwardHandle::SshForwardHandle(SshSession& source, SshSession& endpoint, int bound_port,
                                   std::unique_ptr<ForwardRelay> relay)
    : source_(source), endpoint_(endpoint), bound_port_(bound_port), relay_(std::move(relay)) {
}

SshForwardHandle::~SshForwardHandle() {
    close();
}

Result<std::unique_ptr<ForwardHandle>> SshForwardHandle::start(SshSession& source,
                                                               SshSession& endpoint,
                                                               const ForwardRequest& request) {
    using R = Result<std::unique_ptr<ForwardHandle>>;

    if (!source.is_active() || !endpoint.is_active()) {
        return R::Err("Port forwarding failed: SSH session not active", ErrorType::BindFailed);
    }

    auto mtx = source.io_mutex();
    auto deadline = Clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_TIMEOUT_SECS);
    LIBSSH2_LISTENER* listener = nullptr;
    int bound_port = 0;
    int err = 0;

    while (true) {
        {
            std::lock_guard<std::mutex> lock(*mtx);
            listener = libssh2_channel_forward_listen_ex(
                source.get_raw_session(), request.bind_address.c_str(),
                request.source_port, &bound_port, FORWARD_LISTEN_QUEUE);
            if (!listener) err = libssh2_session_last_errno(source.get_raw_session());
        }
        if (listener || err != LIBSSH2_ERROR_EAGAIN) break;
        if (Clock::now() >= deadline) break;
        wait_readable(source, 50);
    }

    if (!listener) {
        std::string msg = fmt::format(
            "Port forwarding failed: cannot listen on {}:{} on {} (error {})",
            request.bind_address, request.source_port, source.get_target(), err);
        log_warn(fmt::format("ForwardBinder: {}", msg));
        return R::Err(msg, ErrorType::BindFailed);
    }

    SshSession* dst = &endpoint;
    ForwardRequest req = request;
    auto relay = std::make_unique<ForwardRelay>(
        std::make_unique<Libssh2Listener>(source, listener),
        [dst, req, bound_port](const std::atomic<bool>& stop) {
            return open_direct_tcpip(*dst, req, bound_port, stop);
        },
        fmt::format("{}:{}", source.get_target(), bound_port));

    if (!relay->start()) {
        return R::Err("Port forwarding failed: cannot start accept thread", ErrorType::BindFailed);
    }

    std::unique_ptr<ForwardHandle> handle(
        new SshForwardHandle(source, endpoint, bound_port, std::move(relay)));

    log_info(fmt::format("ForwardBinder: {} port {} -> {}:{} via {}",
                         source.get_target(), bound_port, request.endpoint_host,
                         request.endpoint_port, endpoint.get_target()));
    return R::Ok(std::move(handle));
}

void SshForwardHandle::close() {
    if (relay_->is_closed()) return;
    relay_->close();
    log_info(fmt::format("ForwardBinder: closed port {} on {}", bound_port_, source_.get_target()));
}

bool SshForwardHandle::is_alive() const {
    return !relay_->is_closed() && !relay_->listener_failed() &&
           source_.is_active() && endpoint_.is_active();
}
