#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <core/constants.hpp>

// One side of a forwarded connection. Non-blocking: read and write report
// Again instead of waiting.
class ChannelEnd {
public:
    enum class Status { Data, Again, Closed };

    struct Io {
        Status status;
        size_t bytes;
    };

    virtual ~ChannelEnd() = default;

    virtual Io read(char* buf, size_t size) = 0;
    virtual Io write(const char* buf, size_t size) = 0;

    // Block up to ms waiting for the channel to become readable.
    virtual void wait(int ms) = 0;

    // Idempotent.
    virtual void close() = 0;
};

// Source of inbound connections (the remote listener).
class ForwardListener {
public:
    enum class Status { Accepted, Again, Failed };

    struct Accepted {
        Status status;
        std::unique_ptr<ChannelEnd> channel;
        std::string error;
    };

    virtual ~ForwardListener() = default;

    virtual Accepted accept() = 0;
    virtual void wait(int ms) = 0;

    // Stop the remote side from queueing more connections. Idempotent.
    virtual void cancel() = 0;
};

// Opens the outbound side for one accepted connection, or nullptr.
using ChannelOpener = std::function<std::unique_ptr<ChannelEnd>(const std::atomic<bool>& stop)>;

// Copy bytes both ways between a and b until either side closes or stop is
// set. Neither end is closed here.
void splice_channels(ChannelEnd& a, ChannelEnd& b, const std::atomic<bool>& stop,
                     size_t buf_size = FORWARD_BUF_SIZE);

// Accept loop plus one splice thread per connection. A connection whose
// outbound side cannot be opened is dropped on its own; the listener keeps
// accepting. Finished pairs are joined from the accept loop.
class ForwardRelay {
public:
    ForwardRelay(std::unique_ptr<ForwardListener> listener, ChannelOpener open_outbound,
                 std::string label, size_t max_connections = FORWARD_MAX_CONNECTIONS);
    ~ForwardRelay();

    ForwardRelay(const ForwardRelay&) = delete;
    ForwardRelay& operator=(const ForwardRelay&) = delete;

    // False when the accept thread cannot be started.
    bool start();

    // Stop accepting, cancel the listener, then tear down every pair.
    void close();

    bool is_closed() const { return closed_flag_.load(); }
    bool listener_failed() const { return listener_failed_.load(); }
    size_t active_connections() const { return active_.load(); }

    // Pair threads started and not yet joined.
    size_t tracked_pairs() const;

    // Join finished pairs. Returns how many were joined.
    size_t reap_finished();

private:
    struct Pair {
        std::unique_ptr<ChannelEnd> inbound;
        std::unique_ptr<ChannelEnd> outbound;
        std::atomic<bool> done{false};
        std::thread thread;
    };

    std::unique_ptr<ForwardListener> listener_;
    ChannelOpener open_outbound_;
    std::string label_;
    size_t max_connections_;

    std::atomic<bool> stop_accept_{false};
    std::atomic<bool> stop_pairs_{false};
    std::atomic<bool> listener_failed_{false};
    std::atomic<bool> closed_flag_{false};
    std::atomic<size_t> active_{0};
    std::thread accept_thread_;

    mutable std::mutex pairs_mutex_;
    std::list<std::unique_ptr<Pair>> pairs_;
    std::mutex close_mutex_;
    bool closed_ = false;

    void accept_loop();
    void admit(std::unique_ptr<ChannelEnd> inbound, std::unique_ptr<ChannelEnd> outbound);
    void run_pair(Pair* pair);
};
