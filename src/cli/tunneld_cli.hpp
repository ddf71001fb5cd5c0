#pragma once

#include "base_cli.hpp"
#include <mutex>
#include <string>
#include <vector>

// Forward declarations for command registration
void register_tunnel_commands(BaseCLI& cli);
void register_user_commands(BaseCLI& cli);

class TunneldCLI : public BaseCLI {
public:
    TunneldCLI();

    // Load config (creating a default one on first run) and build the
    // runtime. Returns false after printing the problem.
    bool init(const std::string& config_path = "");

    // Interactive shell. Tunnel state changes are printed before each prompt.
    void run_repl();

    // Foreground daemon: auto-start tunnels, log state changes, exit on
    // SIGINT or SIGTERM.
    int run_headless();

private:
    void register_all_commands();

    // Status listener output, drained by the REPL between commands
    // so worker threads never write over the readline prompt.
    void queue_event(const std::string& line);
    std::vector<std::string> drain_events();

    std::mutex events_mutex_;
    std::vector<std::string> events_;
};
