#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "supervisor.hpp"

// name -> Supervisor, plus one operation lock per name. The map lock is
// only ever held for lookups; per-name locks serialize connect, disconnect
// and cancel for that name without blocking other names.
class TunnelRegistry {
public:
    using Factory = std::function<std::shared_ptr<Supervisor>()>;

    std::shared_ptr<Supervisor> get_or_create(const std::string& name, const Factory& make);
    std::shared_ptr<Supervisor> find(const std::string& name) const;
    void remove(const std::string& name);

    // Copy of the current supervisors; safe to iterate without any lock.
    std::vector<std::shared_ptr<Supervisor>> snapshot() const;

    // The lock for `name`, created on first use and kept for the registry's
    // lifetime so two callers can never hold different locks for one name.
    std::shared_ptr<std::mutex> op_lock(const std::string& name);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Supervisor>> supervisors_;
    std::map<std::string, std::shared_ptr<std::mutex>> op_locks_;
};
