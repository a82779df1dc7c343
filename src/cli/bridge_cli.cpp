#include "bridge_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <readline/readline.h>
#include <readline/history.h>

BridgeCLI::BridgeCLI(BridgeService& service) : BaseCLI(service) {
    register_all_commands();
}

void BridgeCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [](BaseCLI& cli, const std::string& arg) {
        cli.quit_requested = true;
    }, "Close the connection and exit");

    add_command("exit", [](BaseCLI& cli, const std::string& arg) {
        cli.quit_requested = true;
    }, "Close the connection and exit");

    add_command("exec", [](BaseCLI& cli, const std::string& arg) {
        cli.last_status = cli.print_reply(cli.service.exec(arg));
    }, "Run a command on the remote host");

    add_command("sudo", [](BaseCLI& cli, const std::string& arg) {
        cli.last_status = cli.print_reply(cli.service.sudo_exec(arg));
    }, "Run a command through sudo");

    add_command("status", [](BaseCLI& cli, const std::string& arg) {
        const auto& cfg = cli.service.config();
        const auto& conn = cfg.connection();
        std::cout << theme::section("Status");
        std::cout << theme::kv("Host", fmt::format("{}:{}", conn.host, conn.port));
        std::cout << theme::kv("User", conn.username);
        std::cout << theme::kv("Auth", conn.password ? "password" : "private key");
        std::cout << theme::kv("Session", cli.service.is_connected() ? "connected" : "not connected");
        std::cout << theme::kv("Root", cli.service.is_elevated() ? "elevated (su)" : "no");
        std::cout << theme::kv("Sudo", cli.service.sudo_enabled() ? "enabled" : "disabled");
        std::cout << theme::kv("Timeout", fmt::format("{}ms", cfg.timeout_ms()));
        std::cout << theme::kv("Max chars", cfg.max_chars() ? std::to_string(*cfg.max_chars()) : "unlimited");
        std::cout << "\n";
        cli.last_status = 0;
    }, "Show connection state");

    add_command("elevate", [](BaseCLI& cli, const std::string& arg) {
        if (!cli.service.config().connection().su_password) {
            std::cout << theme::fail("No su password configured.");
            std::cout << theme::step("Pass --su-password or set su_password in the config file.");
            cli.last_status = 1;
            return;
        }
        auto r = cli.service.elevate();
        if (r.is_err()) {
            std::cout << theme::fail(r.describe());
            cli.last_status = 1;
            return;
        }
        std::cout << theme::ok("Root shell ready");
        cli.last_status = 0;
    }, "Open the su root shell now");
}

int BridgeCLI::run_once(const std::string& mode, const std::string& command) {
    if (mode == "exec") {
        return print_reply(service.exec(command));
    }
    if (mode == "sudo-exec" || mode == "sudo") {
        return print_reply(service.sudo_exec(command));
    }
    std::cerr << theme::fail("Unknown command: " + mode);
    return 2;
}

std::pair<std::string, std::string> BridgeCLI::route_line(const std::string& line) const {
    std::istringstream iss(line);
    std::string command;
    iss >> command;

    std::string args;
    std::getline(iss, args);
    if (!args.empty() && args[0] == ' ') {
        args = args.substr(1);
    }

    if (!has_command(command)) {
        return {"exec", trimmed(line)};
    }
    return {command, args};
}

void BridgeCLI::run_repl() {
    const auto& conn = service.config().connection();
    std::cout << theme::banner(fmt::format("{}@{}:{}", conn.username, conn.host, conn.port));

    auto connected = service.connect();
    if (connected.is_err()) {
        std::cout << theme::fail(connected.describe());
        std::cout << theme::step("Commands will retry the connection.");
    } else {
        std::cout << theme::ok("Connected");
        if (service.is_elevated()) {
            std::cout << theme::ok("Root shell ready");
        }
    }
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_requested) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (trimmed(line).empty()) {
            continue;
        }

        add_history(line.c_str());

        auto routed = route_line(line);
        execute_command(routed.first, routed.second);
    }

    std::cout << theme::dim("Disconnecting...") << "\n";
    service.shutdown();
}
