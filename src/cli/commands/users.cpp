#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <fmt/format.h>
#include <platform/platform.hpp>
#include <crypto/key_buffer.hpp>

static std::string prompt_line(const std::string& label) {
    std::cout << theme::color::TEAL << "    " << label << ": " << theme::color::RESET;
    std::cout.flush();
    std::string line;
    std::getline(std::cin, line);
    return line;
}

static std::string prompt_secret(const std::string& label) {
    return platform::read_secret(theme::color::TEAL + "    " + label + ": " + theme::color::RESET);
}

static bool single_user_arg(const std::string& arg, const char* usage) {
    if (arg.empty() || arg.find(' ') != std::string::npos) {
        std::cout << theme::fail(std::string("Usage: ") + usage);
        return false;
    }
    return true;
}

static void do_register(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime() || !single_user_arg(arg, "register <user>")) return;

    std::string pw = prompt_secret("Password");
    std::string confirm = prompt_secret("Confirm password");
    if (pw.empty()) {
        std::cout << theme::fail("Password cannot be empty.");
        return;
    }
    if (pw != confirm) {
        secure_wipe(pw);
        secure_wipe(confirm);
        std::cout << theme::fail("Passwords do not match.");
        return;
    }

    auto result = cli.runtime->crypto().setup_user_encryption(arg, pw);
    secure_wipe(pw);
    secure_wipe(confirm);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << theme::ok("Encryption keys created for " + arg);
    std::cout << theme::step("Run 'login " + arg + "' to unlock.");
}

static void do_login(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime() || !single_user_arg(arg, "login <user>")) return;

    std::string pw = prompt_secret("Password");
    bool ok = cli.runtime->crypto().authenticate_user(arg, pw);
    secure_wipe(pw);
    if (!ok) {
        std::cout << theme::fail("Authentication failed.");
        return;
    }
    std::cout << theme::ok(arg + " unlocked");
}

static void do_login_oidc(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime() || !single_user_arg(arg, "login-oidc <user>")) return;

    if (!cli.runtime->crypto().authenticate_oidc_user(arg)) {
        std::cout << theme::fail("Could not unlock " + arg);
        return;
    }
    std::cout << theme::ok(arg + " unlocked");
}

static void do_logout(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime() || !single_user_arg(arg, "logout <user>")) return;
    cli.runtime->crypto().logout_user(arg);
    std::cout << theme::ok(arg + " locked");
}

static void do_unlocked(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime() || !single_user_arg(arg, "unlocked <user>")) return;
    if (cli.runtime->crypto().is_user_unlocked(arg)) {
        std::cout << theme::kv(arg, theme::green("unlocked"));
    } else {
        std::cout << theme::kv(arg, theme::dim("locked"));
    }
}

static void do_passwd(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime() || !single_user_arg(arg, "passwd <user>")) return;

    std::string old_pw = prompt_secret("Current password");
    std::string new_pw = prompt_secret("New password");
    std::string confirm = prompt_secret("Confirm new password");

    bool ok = false;
    if (new_pw.empty()) {
        std::cout << theme::fail("Password cannot be empty.");
    } else if (new_pw != confirm) {
        std::cout << theme::fail("Passwords do not match.");
    } else {
        ok = cli.runtime->crypto().change_user_password(arg, old_pw, new_pw);
        if (!ok) std::cout << theme::fail("Password change failed.");
    }
    secure_wipe(old_pw);
    secure_wipe(new_pw);
    secure_wipe(confirm);

    if (ok) {
        std::cout << theme::ok("Password changed for " + arg);
        std::cout << theme::step("Session locked. Log in again with the new password.");
    }
}

// credential add <user> <id> | credential list <user>
static void do_credential(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime()) return;
    auto words = split_args(arg);

    if (words.size() == 2 && words[0] == "list") {
        auto records = cli.runtime->credentials().list(words[1]);
        std::cout << theme::section("Credentials");
        if (records.empty()) {
            std::cout << theme::dim("    None stored for " + words[1]) << "\n\n";
            return;
        }
        for (const auto& r : records) {
            std::cout << theme::color::BLUE << fmt::format("    {:<20}", r.id) << theme::color::RESET
                      << r.username << theme::dim("  " + r.auth_type) << "\n";
        }
        std::cout << "\n";
        return;
    }

    if (words.size() != 3 || words[0] != "add") {
        std::cout << theme::fail("Usage: credential add <user> <id> | credential list <user>");
        return;
    }

    PlainCredential plain;
    plain.owner_user_id = words[1];
    plain.id = words[2];
    plain.name = plain.id;
    plain.username = prompt_line("SSH username");
    plain.auth_type = prompt_line("Auth type (password/key)");

    if (plain.auth_type == "password") {
        plain.password = prompt_secret("SSH password");
    } else if (plain.auth_type == "key") {
        std::string path = prompt_line("Private key file");
        std::ifstream f(path);
        if (!f) {
            std::cout << theme::fail("Cannot read " + path);
            return;
        }
        std::stringstream ss;
        ss << f.rdbuf();
        plain.private_key = ss.str();
        plain.key_password = prompt_secret("Key passphrase (empty for none)");
    } else {
        std::cout << theme::fail("Auth type must be 'password' or 'key'.");
        return;
    }

    auto result = cli.runtime->add_credential(plain);
    secure_wipe(plain.password);
    secure_wipe(plain.private_key);
    secure_wipe(plain.key_password);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << theme::ok("Stored credential " + plain.id + " for " + plain.owner_user_id);
}

void register_user_commands(BaseCLI& cli) {
    cli.add_command("register", do_register, "Create encryption keys for a user");
    cli.add_command("login", do_login, "Unlock a user's data key with a password");
    cli.add_command("login-oidc", do_login_oidc, "Unlock an SSO user's data key");
    cli.add_command("logout", do_logout, "Lock a user's data key");
    cli.add_command("unlocked", do_unlocked, "Show whether a user is unlocked");
    cli.add_command("passwd", do_passwd, "Change a user's password");
    cli.add_command("credential", do_credential, "Add or list encrypted SSH credentials");
}
