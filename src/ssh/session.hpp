#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// One authenticated libssh2 session to a single host. No shell channel is
// opened; the session exists to carry forwarded channels.
//
// All libssh2 calls on the session go through io_mutex(). The session runs
// in non-blocking mode, so every call is retried on EAGAIN with the mutex
// released between attempts.
class SshSession : public SshLink {
public:
    explicit SshSession(const SessionTarget& target);
    ~SshSession() override;

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    // TCP connect, handshake (legacy-tolerant algorithm policy), auth.
    // The whole sequence must finish within target.timeout seconds.
    Result<void> establish(const std::atomic<bool>& cancelled);

    bool check_alive() override;
    bool is_active() const override;
    void close() override;
    const std::string& get_target() const override { return target_str_; }
    std::string last_error() const override;

    LIBSSH2_SESSION* get_raw_session() { return session_; }
    int get_socket() const { return sock_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    int sock_;
    std::atomic<bool> active_;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;
    int missed_keepalives_;
    mutable std::mutex error_mutex_;
    std::string last_error_;

    Result<void> handshake(std::chrono::steady_clock::time_point deadline,
                           const std::atomic<bool>& cancelled);
    Result<void> ssh_userauth(std::chrono::steady_clock::time_point deadline,
                              const std::atomic<bool>& cancelled);
    Result<void> fail(const std::string& msg, ErrorType kind);
    std::string session_error();
    void set_last_error(const std::string& msg);
};

// Idempotent process-wide libssh2_init().
bool ensure_libssh2();
