#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <vector>
#include <fmt/format.h>

BaseCLI::BaseCLI(BridgeService& service) : service(service) {
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        last_status = 1;
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        last_status = 1;
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Commands",   {"exec", "sudo"}},
        {"Connection", {"status", "elevate"}},
        {"General",    {"help", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::AMBER() << theme::color::BOLD()
                  << "  " << cat_name << theme::color::RESET() << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE()
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET()
                          << theme::color::DIM()
                          << it->second.second
                          << theme::color::RESET() << "\n";
            }
        }
    }
    std::cout << theme::dim("\n    A line that is not a command runs as 'exec'.") << "\n\n";
}

int BaseCLI::print_reply(const ToolReply& reply) const {
    std::ostream& out = reply.is_error ? std::cerr : std::cout;
    out << reply.text;
    if (!reply.text.empty() && reply.text.back() != '\n') out << "\n";
    out.flush();
    return reply.is_error ? 1 : 0;
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return code.empty() ? code : std::string("\001") + code + std::string("\002");
    };

    const auto& conn = service.config().connection();
    std::string target = conn.username + "@" + conn.host;

    if (service.is_elevated()) {
        return rl_esc(theme::color::RED()) + target
             + rl_esc(theme::color::RESET()) + "# ";
    } else if (service.is_connected()) {
        return rl_esc(theme::color::GREEN()) + target
             + rl_esc(theme::color::RESET()) + "> ";
    }
    return rl_esc(theme::color::BLUE()) + target
         + rl_esc(theme::color::RESET()) + "> ";
}
