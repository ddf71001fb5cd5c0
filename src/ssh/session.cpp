#include "session.hpp"
#include <core/constants.hpp>
#include <core/error_classifier.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <crypto/key_buffer.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <cstring>
#include <fmt/format.h>

using Clock = std::chrono::steady_clock;

void SessionTarget::wipe() {
    secure_wipe(password);
    secure_wipe(private_key);
    secure_wipe(passphrase);
    password.clear();
    private_key.clear();
    passphrase.clear();
}

bool ensure_libssh2() {
    static std::once_flag once;
    static int rc = -1;
    std::call_once(once, [] { rc = libssh2_init(0); });
    return rc == 0;
}

// Map a libssh2 error code onto the tunnel error taxonomy. Codes that say
// nothing specific fall back to the text of the session's last error.
static ErrorType classify_libssh2(int rc, const std::string& message) {
    switch (rc) {
        case LIBSSH2_ERROR_AUTHENTICATION_FAILED:
        case LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED:
        case LIBSSH2_ERROR_FILE:
            return ErrorType::AuthenticationFailed;
        case LIBSSH2_ERROR_KEX_FAILURE:
        case LIBSSH2_ERROR_METHOD_NONE:
        case LIBSSH2_ERROR_METHOD_NOT_SUPPORTED:
        case LIBSSH2_ERROR_HOSTKEY_INIT:
            return ErrorType::AlgorithmMismatch;
        case LIBSSH2_ERROR_TIMEOUT:
            return ErrorType::Timeout;
        case LIBSSH2_ERROR_SOCKET_SEND:
        case LIBSSH2_ERROR_SOCKET_RECV:
        case LIBSSH2_ERROR_SOCKET_DISCONNECT:
        case LIBSSH2_ERROR_BANNER_RECV:
        case LIBSSH2_ERROR_BANNER_SEND:
            return ErrorType::NetworkUnreachable;
        default:
            return classify_error_message(message);
    }
}

// Block until the socket is ready in the direction libssh2 is waiting on,
// or `ms` elapses.
static void wait_socket(int sock, LIBSSH2_SESSION* session, int ms) {
    short events = 0;
    int dir = libssh2_session_block_directions(session);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;
    platform::poll_socket(sock, events, ms);
}

// Answers every keyboard-interactive prompt with the password. Servers that
// only offer keyboard-interactive (common on appliances) still ask for it.
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    const auto* password = static_cast<const std::string*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(password->c_str());
        responses[i].length = static_cast<unsigned int>(password->length());
    }
}

SshSession::SshSession(const SessionTarget& target)
    : target_(target), session_(nullptr), sock_(-1), active_(false),
      target_str_(target.label()), io_mutex_(std::make_shared<std::mutex>()),
      missed_keepalives_(0) {
}

SshSession::~SshSession() {
    close();
    target_.wipe();
}

Result<void> SshSession::fail(const std::string& msg, ErrorType kind) {
    set_last_error(msg);
    log_warn(fmt::format("ssh {}: {}", target_str_, msg));
    close();
    return Result<void>::Err(msg, kind);
}

std::string SshSession::session_error() {
    if (!session_) return "";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : "";
}

void SshSession::set_last_error(const std::string& msg) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = msg;
}

std::string SshSession::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

Result<void> SshSession::establish(const std::atomic<bool>& cancelled) {
    if (!ensure_libssh2()) {
        return fail("Failed to initialize libssh2", ErrorType::Unknown);
    }

    auto deadline = Clock::now() + std::chrono::seconds(target_.timeout);

    auto tcp = platform::connect_tcp(target_.host, target_.port,
                                     target_.timeout * 1000, cancelled);
    if (tcp.is_err()) {
        return fail(tcp.error, tcp.kind);
    }
    sock_ = tcp.value;

    platform::enable_tcp_keepalive(sock_, 15, target_.keepalive_interval,
                                   target_.keepalive_max_missed);

    auto hs = handshake(deadline, cancelled);
    if (hs.is_err()) return hs;

    auto auth = ssh_userauth(deadline, cancelled);
    if (auth.is_err()) return auth;

    libssh2_keepalive_config(session_, 1, static_cast<unsigned>(target_.keepalive_interval));

    active_ = true;
    missed_keepalives_ = 0;
    log_info(fmt::format("ssh {}: session established", target_str_));
    return Result<void>::Ok();
}

Result<void> SshSession::handshake(Clock::time_point deadline,
                                   const std::atomic<bool>& cancelled) {
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return fail("Failed to create SSH session", ErrorType::Unknown);
    }

    // Method preferences must be set before the handshake. libssh2 drops
    // names it does not implement and only fails if none remain.
    const std::pair<int, const char*> prefs[] = {
        {LIBSSH2_METHOD_KEX,     SSH_KEX_PREFS},
        {LIBSSH2_METHOD_CRYPT_CS, SSH_CIPHER_PREFS},
        {LIBSSH2_METHOD_CRYPT_SC, SSH_CIPHER_PREFS},
        {LIBSSH2_METHOD_MAC_CS,  SSH_MAC_PREFS},
        {LIBSSH2_METHOD_MAC_SC,  SSH_MAC_PREFS},
        {LIBSSH2_METHOD_COMP_CS, SSH_COMPRESSION_PREFS},
        {LIBSSH2_METHOD_COMP_SC, SSH_COMPRESSION_PREFS},
    };
    for (const auto& [method, list] : prefs) {
        if (libssh2_session_method_pref(session_, method, list) != 0) {
            log_warn(fmt::format("ssh {}: method preference rejected: {}",
                                 target_str_, session_error()));
        }
    }

    libssh2_session_set_blocking(session_, 0);

    int rc;
    while ((rc = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (cancelled.load()) return fail("Connection attempt cancelled", ErrorType::Unknown);
        if (Clock::now() >= deadline) {
            return fail(fmt::format("SSH handshake with {} timed out", target_.host),
                        ErrorType::Timeout);
        }
        wait_socket(sock_, session_, 100);
    }

    if (rc != 0) {
        std::string detail = session_error();
        return fail("SSH handshake failed: " + detail, classify_libssh2(rc, detail));
    }
    return Result<void>::Ok();
}

Result<void> SshSession::ssh_userauth(Clock::time_point deadline,
                                      const std::atomic<bool>& cancelled) {
    auto timed_out = [&]() { return Clock::now() >= deadline; };

    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              static_cast<unsigned>(target_.user.length()))) == nullptr) {
        if (libssh2_userauth_authenticated(session_)) {
            return Result<void>::Ok();   // "none" auth accepted
        }
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        if (cancelled.load()) return fail("Connection attempt cancelled", ErrorType::Unknown);
        if (timed_out()) return fail("Authentication timed out", ErrorType::Timeout);
        wait_socket(sock_, session_, 100);
    }
    std::string methods = auth_list ? auth_list : "";

    int rc = LIBSSH2_ERROR_AUTHENTICATION_FAILED;

    if (target_.method == AuthMethod::Key) {
        std::string key = normalize_newlines(target_.private_key);
        if (!has_pem_markers(key)) {
            secure_wipe(key);
            return fail("Invalid SSH key format", ErrorType::AuthenticationFailed);
        }
        const char* passphrase = target_.passphrase.empty() ? nullptr : target_.passphrase.c_str();
        while ((rc = libssh2_userauth_publickey_frommemory(
                    session_, target_.user.c_str(), target_.user.length(),
                    nullptr, 0, key.c_str(), key.length(), passphrase)) == LIBSSH2_ERROR_EAGAIN) {
            if (cancelled.load()) { secure_wipe(key); return fail("Connection attempt cancelled", ErrorType::Unknown); }
            if (timed_out()) { secure_wipe(key); return fail("Authentication timed out", ErrorType::Timeout); }
            wait_socket(sock_, session_, 100);
        }
        secure_wipe(key);
        if (rc == 0) return Result<void>::Ok();

        std::string detail = session_error();
        return fail("Public key authentication failed: " + detail,
                    classify_libssh2(rc, detail) == ErrorType::Unknown
                        ? ErrorType::AuthenticationFailed
                        : classify_libssh2(rc, detail));
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        while ((rc = libssh2_userauth_password(session_, target_.user.c_str(),
                                               target_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            if (cancelled.load()) return fail("Connection attempt cancelled", ErrorType::Unknown);
            if (timed_out()) return fail("Authentication timed out", ErrorType::Timeout);
            wait_socket(sock_, session_, 100);
        }
        if (rc == 0) return Result<void>::Ok();
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        *libssh2_session_abstract(session_) = &target_.password;
        while ((rc = libssh2_userauth_keyboard_interactive(session_, target_.user.c_str(),
                                                           kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            if (cancelled.load()) return fail("Connection attempt cancelled", ErrorType::Unknown);
            if (timed_out()) return fail("Authentication timed out", ErrorType::Timeout);
            wait_socket(sock_, session_, 100);
        }
        *libssh2_session_abstract(session_) = nullptr;
        if (rc == 0) return Result<void>::Ok();
    }

    return fail(fmt::format("Authentication failed for {}@{} (methods: {})",
                            target_.user, target_.host, methods.empty() ? "none" : methods),
                ErrorType::AuthenticationFailed);
}

void SshSession::close() {
    // Mark inactive first so concurrent operations bail out early
    active_ = false;

    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}

bool SshSession::is_active() const {
    return active_;
}

bool SshSession::check_alive() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!active_ || !session_ || sock_ < 0) return false;

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        set_last_error("Connection closed by remote host");
        active_ = false;
        return false;
    }

    int seconds_to_next = 0;
    int rc = libssh2_keepalive_send(session_, &seconds_to_next);
    if (rc != 0 && rc != LIBSSH2_ERROR_EAGAIN) {
        if (++missed_keepalives_ >= target_.keepalive_max_missed) {
            set_last_error(fmt::format("Keepalive timeout ({} probes missed)", missed_keepalives_));
            active_ = false;
            return false;
        }
    } else {
        missed_keepalives_ = 0;
    }
    return true;
}
