#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <vector>
#include <fmt/format.h>

std::vector<std::string> split_args(const std::string& args) {
    std::vector<std::string> out;
    std::istringstream iss(args);
    std::string word;
    while (iss >> word) out.push_back(word);
    return out;
}

void BaseCLI::add_command(const std::string& name,
                          CommandHandler handler,
                          const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_runtime() {
    if (!runtime) {
        std::cout << theme::fail("Service not running.");
        return false;
    }
    return true;
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Tunnels", {"status", "tunnels", "connect", "disconnect", "cancel"}},
        {"Users",   {"register", "login", "login-oidc", "logout", "unlocked", "passwd", "credential"}},
        {"General", {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::TEAL << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::TEAL) + "tunneld" + rl_esc(theme::color::RESET);
    if (runtime) {
        size_t up = 0;
        for (const auto& [name, st] : runtime->tunnels().get_all_statuses()) {
            if (st.state == TunnelState::Connected) up++;
        }
        if (up > 0) {
            prompt += ":" + rl_esc(theme::color::GREEN) + std::to_string(up) + " up"
                    + rl_esc(theme::color::RESET);
        }
    }
    return prompt + "> ";
}
