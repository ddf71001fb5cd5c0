#include "tunneld_cli.hpp"
#include "theme.hpp"
#include <atomic>
#include <iostream>
#include <sstream>
#include <csignal>
#include <cstdlib>
#include <core/config.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <readline/readline.h>
#include <readline/history.h>

static std::atomic<bool> g_stop_requested{false};

static void handle_stop_signal(int) {
    g_stop_requested = true;
}

static std::string format_event(const std::string& name, const TunnelStatus& st) {
    std::string line = name + ": " + tunnel_state_name(st.state);
    if (st.state == TunnelState::Retrying) {
        line += fmt::format(" ({}/{})", st.retry_count, st.max_retries);
    }
    if (st.reason) line += " - " + *st.reason;
    return line;
}

TunneldCLI::TunneldCLI() : BaseCLI() {
    register_all_commands();
}

void TunneldCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [](BaseCLI& cli, const std::string& arg) {
        std::cout << theme::dim("    Stopping tunnels...") << "\n";
        cli.quit_requested = true;
    }, "Stop all tunnels and exit");

    add_command("exit", [](BaseCLI& cli, const std::string& arg) {
        std::cout << theme::dim("    Stopping tunnels...") << "\n";
        cli.quit_requested = true;
    }, "Stop all tunnels and exit");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_tunnel_commands(*this);
    register_user_commands(*this);
}

bool TunneldCLI::init(const std::string& config_path) {
    fs::path path = config_path.empty() ? get_config_path() : fs::path(config_path);

    if (!config_exists(path)) {
        auto created = create_default_config(path);
        if (created.is_err()) {
            std::cout << theme::fail("Failed to create config file: " + created.error);
            return false;
        }
        std::cout << theme::info("Created " + path.string());
    }

    auto loaded = Config::load(path);
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        return false;
    }
    config = loaded.value;

    if (!config->log_path().empty()) {
        set_log_path(config->log_path());
    }

    runtime = std::make_unique<TunneldRuntime>(config.value());
    runtime->tunnels().set_status_listener(
        [this](const std::string& name, const TunnelStatus& st) {
            // Waiting republishes its countdown every second; 'status' shows it.
            if (st.state == TunnelState::Waiting) return;
            queue_event(format_event(name, st));
        });
    return true;
}

void TunneldCLI::queue_event(const std::string& line) {
    std::lock_guard<std::mutex> lock(events_mutex_);
    events_.push_back(line);
}

std::vector<std::string> TunneldCLI::drain_events() {
    std::lock_guard<std::mutex> lock(events_mutex_);
    std::vector<std::string> out;
    out.swap(events_);
    return out;
}

void TunneldCLI::run_repl() {
    std::cout << theme::banner();

    std::cout << theme::section("Starting");
    runtime->start();
    std::cout << theme::kv("Hosts", std::to_string(config->hosts().size()));
    std::cout << theme::kv("Tunnels", std::to_string(runtime->specs().size()));
    std::cout << theme::kv("Log", tunneld_log_path().string());
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_requested) {
        for (const auto& ev : drain_events()) {
            std::cout << theme::dim("    " + ev) << "\n";
        }

        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
    }

    runtime->shutdown();
    for (const auto& ev : drain_events()) {
        std::cout << theme::dim("    " + ev) << "\n";
    }
}

int TunneldCLI::run_headless() {
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    // Headless output goes straight to stdout alongside the log.
    runtime->tunnels().set_status_listener(
        [](const std::string& name, const TunnelStatus& st) {
            if (st.state == TunnelState::Waiting) return;
            std::cout << format_event(name, st) << std::endl;
        });

    log_info(fmt::format("tunneld: headless start, {} tunnel(s)", runtime->specs().size()));
    runtime->start();

    while (!g_stop_requested.load()) {
        platform::sleep_ms(200);
    }

    log_info("tunneld: stop signal received");
    runtime->shutdown();
    return 0;
}
