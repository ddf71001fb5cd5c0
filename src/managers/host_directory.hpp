#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "tunnel_types.hpp"

// Lookup of configured hosts by label (display name or "user@ip").
class HostDirectory {
public:
    virtual ~HostDirectory() = default;

    virtual std::optional<HostRef> find(const std::string& label) const = 0;
    virtual std::vector<std::string> labels() const = 0;
};

// Host list held in memory; replaced wholesale when the config reloads.
class StaticHostDirectory : public HostDirectory {
public:
    StaticHostDirectory() = default;
    explicit StaticHostDirectory(std::vector<HostRef> hosts);

    void set_hosts(std::vector<HostRef> hosts);

    std::optional<HostRef> find(const std::string& label) const override;
    std::vector<std::string> labels() const override;

private:
    mutable std::mutex mutex_;
    std::vector<HostRef> hosts_;
};
