#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <managers/runtime.hpp>

class BaseCLI {
public:
    BaseCLI() = default;
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& help);

    bool require_runtime();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Public state
    std::optional<Config> config;
    std::unique_ptr<TunneldRuntime> runtime;
    bool quit_requested = false;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};

// Split "a b c" into whitespace-separated words.
std::vector<std::string> split_args(const std::string& args);
