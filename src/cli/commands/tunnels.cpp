#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>

static std::string describe(const TunnelStatus& st) {
    std::string out = theme::state(st.state);
    if (st.state == TunnelState::Retrying || st.state == TunnelState::Waiting) {
        out += theme::dim(fmt::format("  attempt {}/{}", st.retry_count, st.max_retries));
    }
    if (st.next_retry_in_seconds) {
        out += theme::dim(fmt::format("  next in {}s", *st.next_retry_in_seconds));
    }
    if (st.reason) {
        out += theme::dim("  " + *st.reason);
    }
    return out;
}

static void print_status_line(const std::string& name, const TunnelStatus& st) {
    std::cout << theme::color::BLUE << fmt::format("    {:<36}", name)
              << theme::color::RESET << describe(st) << "\n";
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime()) return;
    auto& svc = cli.runtime->tunnels();

    if (!arg.empty()) {
        auto st = svc.get_status(arg);
        if (!st && !cli.runtime->find_spec(arg)) {
            std::cout << theme::fail("Unknown tunnel: " + arg);
            return;
        }
        std::cout << theme::section("Tunnel");
        print_status_line(arg, st.value_or(TunnelStatus{}));
        if (st && st->error_type) {
            std::cout << theme::kv("Error", error_type_name(*st->error_type));
        }
        std::cout << "\n";
        return;
    }

    std::cout << theme::section("Tunnels");
    auto all = svc.get_all_statuses();
    if (cli.runtime->specs().empty() && all.empty()) {
        std::cout << theme::dim("    No tunnels configured.") << "\n\n";
        return;
    }
    // Configured tunnels not in the registry are idle.
    for (const auto& spec : cli.runtime->specs()) {
        auto it = all.find(spec.name);
        print_status_line(spec.name, it != all.end() ? it->second : TunnelStatus{});
        if (it != all.end()) all.erase(it);
    }
    for (const auto& [name, st] : all) {
        print_status_line(name, st);
    }
    std::cout << "\n";
}

static void do_tunnels(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime()) return;

    std::cout << theme::section("Configured");
    if (cli.runtime->specs().empty()) {
        std::cout << theme::dim("    No tunnels configured.") << "\n\n";
        return;
    }
    for (const auto& s : cli.runtime->specs()) {
        std::cout << theme::color::BLUE << fmt::format("    {:<36}", s.name) << theme::color::RESET
                  << fmt::format("{} -> {}:{}", s.source_port, s.endpoint_host, s.endpoint_port)
                  << theme::dim(fmt::format("  retries {}  every {}s{}{}",
                                            s.max_retries, s.retry_interval_ms / 1000,
                                            s.auto_start ? "  auto" : "",
                                            s.is_pinned ? "  pinned" : ""))
                  << "\n";
    }
    std::cout << "\n";
}

static void do_connect(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime()) return;
    if (arg.empty()) {
        std::cout << theme::fail("Usage: connect <tunnel>");
        return;
    }

    auto result = cli.runtime->connect(arg);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    if (result.value.state == TunnelState::Connecting && result.value.retry_count == 0) {
        std::cout << theme::step("Connecting " + arg);
    } else {
        std::cout << theme::info(arg + " is already " + tunnel_state_name(result.value.state));
    }
}

static void stop_command(BaseCLI& cli, const std::string& arg, bool cancel) {
    if (!cli.require_runtime()) return;
    if (arg.empty()) {
        std::cout << theme::fail(cancel ? "Usage: cancel <tunnel>" : "Usage: disconnect <tunnel>");
        return;
    }

    auto& svc = cli.runtime->tunnels();
    auto result = cancel ? svc.cancel(arg) : svc.disconnect(arg);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << theme::ok(arg + " " + tunnel_state_name(result.value.state));
}

static void do_disconnect(BaseCLI& cli, const std::string& arg) {
    stop_command(cli, arg, false);
}

static void do_cancel(BaseCLI& cli, const std::string& arg) {
    stop_command(cli, arg, true);
}

void register_tunnel_commands(BaseCLI& cli) {
    cli.add_command("status", do_status, "Show tunnel state (all, or one by name)");
    cli.add_command("tunnels", do_tunnels, "List configured tunnels");
    cli.add_command("connect", do_connect, "Start a tunnel");
    cli.add_command("disconnect", do_disconnect, "Stop a tunnel");
    cli.add_command("cancel", do_cancel, "Abort a connecting or retrying tunnel");
}
