#include "forward_relay.hpp"
#include <core/log.hpp>
#include <system_error>
#include <vector>
#include <fmt/format.h>

// ── Splice ────────────────────────────────────────────────

// Write all of buf. False when the channel closed or stop was set.
static bool write_all(ChannelEnd& to, const char* buf, size_t n, const std::atomic<bool>& stop) {
    size_t sent = 0;
    while (sent < n) {
        if (stop.load()) return false;
        auto w = to.write(buf + sent, n - sent);
        if (w.status == ChannelEnd::Status::Closed) return false;
        if (w.status == ChannelEnd::Status::Again) {
            to.wait(1);
            continue;
        }
        sent += w.bytes;
    }
    return true;
}

enum class PumpResult { Moved, Idle, Closed };

static PumpResult pump(ChannelEnd& from, ChannelEnd& to, char* buf, size_t size,
                       const std::atomic<bool>& stop) {
    auto r = from.read(buf, size);
    switch (r.status) {
    case ChannelEnd::Status::Data:
        return write_all(to, buf, r.bytes, stop) ? PumpResult::Moved : PumpResult::Closed;
    case ChannelEnd::Status::Again:
        return PumpResult::Idle;
    case ChannelEnd::Status::Closed:
        break;
    }
    return PumpResult::Closed;
}

void splice_channels(ChannelEnd& a, ChannelEnd& b, const std::atomic<bool>& stop,
                     size_t buf_size) {
    std::vector<char> up(buf_size);
    std::vector<char> down(buf_size);

    while (!stop.load()) {
        auto ab = pump(a, b, up.data(), up.size(), stop);
        if (ab == PumpResult::Closed) break;
        auto ba = pump(b, a, down.data(), down.size(), stop);
        if (ba == PumpResult::Closed) break;

        if (ab == PumpResult::Idle && ba == PumpResult::Idle) {
            a.wait(FORWARD_POLL_MS / 2);
            b.wait(FORWARD_POLL_MS / 2);
        }
    }
}

// ── ForwardRelay ──────────────────────────────────────────

ForwardRelay::ForwardRelay(std::unique_ptr<ForwardListener> listener, ChannelOpener open_outbound,
                           std::string label, size_t max_connections)
    : listener_(std::move(listener)), open_outbound_(std::move(open_outbound)),
      label_(std::move(label)), max_connections_(max_connections) {
}

ForwardRelay::~ForwardRelay() {
    close();
}

bool ForwardRelay::start() {
    try {
        accept_thread_ = std::thread(&ForwardRelay::accept_loop, this);
    } catch (const std::system_error& e) {
        log_error(fmt::format("ForwardRelay {}: cannot start accept thread: {}", label_, e.what()));
        return false;
    }
    return true;
}

void ForwardRelay::accept_loop() {
    while (!stop_accept_.load()) {
        reap_finished();

        auto in = listener_->accept();
        if (in.status == ForwardListener::Status::Again) {
            listener_->wait(FORWARD_POLL_MS);
            continue;
        }
        if (in.status == ForwardListener::Status::Failed) {
            log_warn(fmt::format("ForwardRelay {}: listener failed: {}", label_, in.error));
            listener_failed_ = true;
            break;
        }

        auto out = open_outbound_(stop_accept_);
        if (!out) {
            log_warn(fmt::format("ForwardRelay {}: outbound channel failed, dropping connection",
                                 label_));
            in.channel->close();
            continue;
        }
        admit(std::move(in.channel), std::move(out));
    }
}

void ForwardRelay::admit(std::unique_ptr<ChannelEnd> inbound, std::unique_ptr<ChannelEnd> outbound) {
    if (active_.load() >= max_connections_) {
        log_warn(fmt::format("ForwardRelay {}: {} connections open, refusing another",
                             label_, max_connections_));
        outbound->close();
        inbound->close();
        return;
    }

    auto pair = std::make_unique<Pair>();
    pair->inbound = std::move(inbound);
    pair->outbound = std::move(outbound);

    active_++;
    try {
        pair->thread = std::thread(&ForwardRelay::run_pair, this, pair.get());
    } catch (const std::system_error& e) {
        active_--;
        log_error(fmt::format("ForwardRelay {}: cannot start splice thread: {}", label_, e.what()));
        pair->outbound->close();
        pair->inbound->close();
        return;
    }

    std::lock_guard<std::mutex> lock(pairs_mutex_);
    pairs_.push_back(std::move(pair));
}

void ForwardRelay::run_pair(Pair* pair) {
    splice_channels(*pair->inbound, *pair->outbound, stop_pairs_);
    pair->outbound->close();
    pair->inbound->close();
    active_--;
    pair->done = true;
}

size_t ForwardRelay::reap_finished() {
    std::lock_guard<std::mutex> lock(pairs_mutex_);
    size_t n = 0;
    for (auto it = pairs_.begin(); it != pairs_.end();) {
        if ((*it)->done.load()) {
            if ((*it)->thread.joinable()) (*it)->thread.join();
            it = pairs_.erase(it);
            n++;
        } else {
            ++it;
        }
    }
    return n;
}

size_t ForwardRelay::tracked_pairs() const {
    std::lock_guard<std::mutex> lock(pairs_mutex_);
    return pairs_.size();
}

void ForwardRelay::close() {
    std::lock_guard<std::mutex> guard(close_mutex_);
    if (closed_) return;
    closed_ = true;
    closed_flag_ = true;

    // Stop accepting first, then tear down spliced pairs.
    stop_accept_ = true;
    if (accept_thread_.joinable()) accept_thread_.join();
    if (listener_) listener_->cancel();

    stop_pairs_ = true;
    std::list<std::unique_ptr<Pair>> pairs;
    {
        std::lock_guard<std::mutex> lock(pairs_mutex_);
        pairs.swap(pairs_);
    }
    for (auto& p : pairs) {
        if (p->thread.joinable()) p->thread.join();
    }
}
