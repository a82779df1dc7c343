#pragma once

#include <string>
#include "base_cli.hpp"

class BridgeCLI : public BaseCLI {
public:
    explicit BridgeCLI(BridgeService& service);

    // `exec <cmd>` / `sudo-exec <cmd>` from the command line. Returns the exit code.
    int run_once(const std::string& mode, const std::string& command);

    // Interactive loop until quit or EOF.
    void run_repl();

    // Split a REPL line into command and argument string, applying the
    // bare-line-means-exec rule.
    std::pair<std::string, std::string> route_line(const std::string& line) const;

private:
    void register_all_commands();
};
