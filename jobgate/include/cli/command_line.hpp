#pragma once

#include <string>
#include <utility>
#include <vector>

#include "model/config.hpp"

enum class Mode {
    Run,
    Status,
    Release,
    Help
};

/**
 * @brief Parsed argv: run mode, config file, option overrides and the workload argv.
 *
 * Overrides are kept as config-file key/value pairs so they go through the same
 * parsing as the file and the environment, applied last.
 */
struct CommandLine {
    Mode mode{Mode::Run};
    std::string configPath;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::vector<std::string> command;
};

/**
 * @brief Parse arguments (without argv[0]).
 *
 * Options stop at "--" or at the first non-option word, which starts the command.
 * @return false with err set on an unknown option, a missing value, or a Run mode
 *         without a command.
 */
bool parseCommandLine(const std::vector<std::string>& args, CommandLine& out, std::string& err);

/**
 * @brief Defaults, then config file, then environment, then command-line overrides.
 *
 * Without --config, kDefaultConfigFile is read only if it exists.
 */
bool resolveConfig(const CommandLine& cli, Config& cfg, std::string& err);

/** @brief Usage text for --help and usage errors. */
std::string usageText(const std::string& program);
