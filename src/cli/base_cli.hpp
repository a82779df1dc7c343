#pragma once

#include <string>
#include <map>
#include <functional>
#include <managers/bridge_service.hpp>

// Command registry shared by the one-shot and interactive front ends.
class BaseCLI {
public:
    explicit BaseCLI(BridgeService& service);
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool has_command(const std::string& name) const { return commands_.count(name) > 0; }

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Print a reply: output to stdout, errors to stderr. Returns the exit code.
    int print_reply(const ToolReply& reply) const;

    BridgeService& service;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

    bool quit_requested = false;
    int last_status = 0;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
