#include "tunnel_registry.hpp"

std::shared_ptr<Supervisor> TunnelRegistry::get_or_create(const std::string& name,
                                                          const Factory& make) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = supervisors_.find(name);
    if (it != supervisors_.end()) return it->second;
    auto sup = make();
    supervisors_[name] = sup;
    return sup;
}

std::shared_ptr<Supervisor> TunnelRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = supervisors_.find(name);
    return it == supervisors_.end() ? nullptr : it->second;
}

void TunnelRegistry::remove(const std::string& name) {
    std::shared_ptr<Supervisor> doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = supervisors_.find(name);
        if (it == supervisors_.end()) return;
        doomed = std::move(it->second);
        supervisors_.erase(it);
    }
    // Last reference may join a worker; do it outside the map lock
    doomed.reset();
}

std::vector<std::shared_ptr<Supervisor>> TunnelRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Supervisor>> out;
    out.reserve(supervisors_.size());
    for (const auto& [name, sup] : supervisors_) out.push_back(sup);
    return out;
}

std::shared_ptr<std::mutex> TunnelRegistry::op_lock(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& m = op_locks_[name];
    if (!m) m = std::make_shared<std::mutex>();
    return m;
}

size_t TunnelRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return supervisors_.size();
}
