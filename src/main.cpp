#include <iostream>
#include <vector>
#include <string>
#include <cstdlib>
#include "cli/arguments.hpp"
#include "cli/bridge_cli.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/signals.hpp>
#include <ssh/libssh2_transport.hpp>
#include <readline/readline.h>

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::blue("    sshbridge [options]")
              << theme::dim("                      Interactive shell") << "\n";
    std::cout << theme::blue("    sshbridge [options] exec ")
              << theme::amber("<cmd>")
              << theme::dim("           Run one command") << "\n";
    std::cout << theme::blue("    sshbridge [options] sudo-exec ")
              << theme::amber("<cmd>")
              << theme::dim("      Run one command through sudo") << "\n";

    std::cout << theme::section("Options");
    std::cout << theme::kv("--host", "Remote host (required)")
              << theme::kv("--port", "SSH port (default 22)")
              << theme::kv("--user", "Login user (required)")
              << theme::kv("--password", "Login password")
              << theme::kv("--key", "Private key file")
              << theme::kv("--su-password", "Password for `su -`; commands then run as root")
              << theme::kv("--sudo-password", "Password piped to sudo for sudo-exec")
              << theme::kv("--timeout", "Command timeout in ms (default 60000)")
              << theme::kv("--maxChars", "Max command length, or 'none' (default 1000)")
              << theme::kv("--disable-sudo", "Refuse sudo-exec")
              << theme::kv("--config", "YAML settings file (default ~/.sshbridge/config.yaml)")
              << theme::kv("--log-level", "debug | info | warn | error")
              << theme::kv("--log-file", "Log file (default <tmp>/sshbridge.log)")
              << theme::kv("--verbose", "Also log to stderr");
    std::cout << "\n"
              << theme::dim("    Every option can also be set as SSHBRIDGE_<NAME>, e.g. SSHBRIDGE_HOST.")
              << "\n\n";
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto parsed = parse_arguments(args);
    if (parsed.is_err()) {
        std::cerr << theme::fail(parsed.describe());
        print_usage();
        return 2;
    }
    const CliArguments& cli_args = parsed.value;

    if (cli_args.show_version) {
        std::cout << theme::bold("sshbridge") << theme::dim(std::string(" version ") + SSHBRIDGE_VERSION) << "\n";
        return 0;
    }
    if (cli_args.show_help) {
        print_usage();
        return 0;
    }

    auto config = Config::load(cli_args.settings, cli_args.config_path);
    if (config.is_err()) {
        std::cerr << theme::fail(config.describe());
        return 2;
    }

    log_configure(config.value.log_level(), config.value.log_file(), config.value.log_stderr());
    log_info(fmt::format("sshbridge {} starting for {}@{}", SSHBRIDGE_VERSION,
                         config.value.connection().username, config.value.connection().host));

    BridgeService service(config.value, std::make_shared<Libssh2Transport>());

    platform::install_shutdown_handler([&service](int sig) {
        log_info(fmt::format("Signal {} received, closing connection", sig));
        rl_cleanup_after_signal();
        service.shutdown();
        std::_Exit(128 + sig);
    });

    BridgeCLI cli(service);

    if (!cli_args.positional.empty()) {
        const std::string& mode = cli_args.positional[0];
        int rc = cli.run_once(mode, join_words(cli_args.positional, 1));
        service.shutdown();
        return rc;
    }

    cli.run_repl();
    return 0;
}
