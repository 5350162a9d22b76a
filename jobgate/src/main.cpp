#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "cli/command_line.hpp"
#include "gate.hpp"
#include "logging/logger.hpp"
#include "model/config.hpp"
#include "util/error.hpp"

namespace {
constexpr int kExitUsage = 2;
} // namespace

// Entry point: resolve configuration, then dispatch to a gated run or an operator subcommand.
int main(int argc, char* argv[]) {
    std::string program = argc > 0 ? argv[0] : "jobgate";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    CommandLine cli;
    std::string err;
    if (!parseCommandLine(args, cli, err)) {
        std::cerr << usageText(program) << "\n";
        die(err, kExitUsage);
    }
    if (cli.mode == Mode::Help) {
        std::cout << usageText(program);
        return EXIT_SUCCESS;
    }

    Config cfg{};
    if (!resolveConfig(cli, cfg, err)) {
        die("config error: " + err, kExitUsage);
    }

    if (!openLog(cfg.logFile)) {
        die("config error: cannot open log file " + cfg.logFile, kExitUsage);
    }
    setLogQuiet(cfg.quiet != 0);

    Gate gate;
    int rc;
    switch (cli.mode) {
        case Mode::Status:
            rc = gate.status(cfg);
            break;
        case Mode::Release:
            rc = gate.releaseOne(cfg);
            break;
        default:
            rc = gate.run(cfg, cli.command);
            break;
    }

    closeLog();
    return rc;
}
