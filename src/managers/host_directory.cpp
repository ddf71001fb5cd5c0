#include "host_directory.hpp"

StaticHostDirectory::StaticHostDirectory(std::vector<HostRef> hosts)
    : hosts_(std::move(hosts)) {}

void StaticHostDirectory::set_hosts(std::vector<HostRef> hosts) {
    std::lock_guard<std::mutex> lock(mutex_);
    hosts_ = std::move(hosts);
}

std::optional<HostRef> StaticHostDirectory::find(const std::string& label) const {
    std::lock_guard<std::mutex> lock(mutex_);
    // Display names win over user@ip, so check them first
    for (const auto& h : hosts_) {
        if (!h.name.empty() && h.name == label) return h;
    }
    for (const auto& h : hosts_) {
        if (h.username + "@" + h.address == label) return h;
    }
    return std::nullopt;
}

std::vector<std::string> StaticHostDirectory::labels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& h : hosts_) out.push_back(host_label(h));
    return out;
}
