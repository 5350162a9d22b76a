#include "cli/command_line.hpp"

#include <unistd.h>

namespace {
struct OptionSpec {
    const char* shortName;  // may be nullptr
    const char* longName;
    const char* key;        // config key the value feeds, nullptr for --config
    bool takesValue;
    const char* fixedValue; // value for flag options
};

const OptionSpec kOptions[] = {
    {"-j", "--max-jobs", "MAX_CONCURRENT_JOBS", true, nullptr},
    {"-i", "--retry-interval", "RETRY_INTERVAL", true, nullptr},
    {nullptr, "--retry-interval-ms", "RETRY_INTERVAL_MS", true, nullptr},
    {"-t", "--timeout", "ACQUIRE_TIMEOUT", true, nullptr},
    {"-f", "--file", "SEMAPHORE_FILE", true, nullptr},
    {nullptr, "--log", "LOG_FILE", true, nullptr},
    {"-q", "--quiet", "QUIET", false, "1"},
    {nullptr, "--no-gitignore", "WRITE_GITIGNORE", false, "0"},
    {nullptr, "--config", nullptr, true, nullptr},
};

const OptionSpec* findOption(const std::string& name) {
    for (const auto& opt : kOptions) {
        if (name == opt.longName || (opt.shortName != nullptr && name == opt.shortName)) {
            return &opt;
        }
    }
    return nullptr;
}
} // namespace

bool parseCommandLine(const std::vector<std::string>& args, CommandLine& out, std::string& err) {
    out = CommandLine{};
    size_t i = 0;

    if (i < args.size()) {
        if (args[i] == "status") {
            out.mode = Mode::Status;
            ++i;
        } else if (args[i] == "release") {
            out.mode = Mode::Release;
            ++i;
        } else if (args[i] == "help") {
            out.mode = Mode::Help;
            return true;
        }
    }

    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--") {
            ++i;
            break;
        }
        if (arg == "-h" || arg == "--help") {
            out.mode = Mode::Help;
            return true;
        }
        if (arg.empty() || arg[0] != '-' || arg == "-") {
            break;
        }

        // --name=value form.
        std::string name = arg;
        std::string inlineValue;
        bool hasInline = false;
        auto eq = arg.find('=');
        if (arg.compare(0, 2, "--") == 0 && eq != std::string::npos) {
            name = arg.substr(0, eq);
            inlineValue = arg.substr(eq + 1);
            hasInline = true;
        }

        const OptionSpec* opt = findOption(name);
        if (opt == nullptr) {
            err = "Unknown option: " + arg;
            return false;
        }

        std::string value;
        if (opt->takesValue) {
            if (hasInline) {
                value = inlineValue;
            } else if (i + 1 < args.size()) {
                value = args[++i];
            } else {
                err = "Missing value for option: " + name;
                return false;
            }
        } else {
            if (hasInline) {
                err = "Option takes no value: " + name;
                return false;
            }
            value = opt->fixedValue;
        }

        if (opt->key == nullptr) {
            out.configPath = value;
        } else {
            out.overrides.emplace_back(opt->key, value);
        }
    }

    for (; i < args.size(); ++i) {
        out.command.push_back(args[i]);
    }

    if (out.mode == Mode::Run && out.command.empty()) {
        err = "No command given";
        return false;
    }
    if (out.mode != Mode::Run && !out.command.empty()) {
        err = "Unexpected argument: " + out.command.front();
        return false;
    }
    return true;
}

bool resolveConfig(const CommandLine& cli, Config& cfg, std::string& err) {
    applyDefaults(cfg);

    if (!cli.configPath.empty()) {
        if (!parseConfigFile(cli.configPath, cfg, err)) {
            return false;
        }
    } else if (access(kDefaultConfigFile, R_OK) == 0) {
        if (!parseConfigFile(kDefaultConfigFile, cfg, err)) {
            return false;
        }
    }

    if (!applyEnvironment(cfg, err)) {
        return false;
    }

    for (const auto& kv : cli.overrides) {
        if (!applySetting(cfg, kv.first, kv.second, err)) {
            err = "command line: " + err;
            return false;
        }
    }
    return validateConfig(cfg, err);
}

std::string usageText(const std::string& program) {
    return "Usage: " + program + " [options] [--] <command> [args...]\n"
           "       " + program + " status  [options]\n"
           "       " + program + " release [options]\n"
           "\n"
           "Runs <command> once fewer than MAX_CONCURRENT_JOBS other invocations sharing the\n"
           "same semaphore file are running; otherwise waits and retries.\n"
           "\n"
           "Options:\n"
           "  -j, --max-jobs N           maximum simultaneous holders (default 1)\n"
           "  -i, --retry-interval S     seconds between attempts while saturated (default 5)\n"
           "      --retry-interval-ms MS same, in milliseconds\n"
           "  -t, --timeout S            give up after S seconds, exit 124 (default 0 = never)\n"
           "  -f, --file PATH            semaphore file (default ./tmp/locks/semaphore.lock)\n"
           "      --log PATH             append log lines to PATH instead of stderr\n"
           "  -q, --quiet                only warnings and errors\n"
           "      --no-gitignore         do not write a .gitignore beside the lock directory\n"
           "      --config PATH          key = value config file (default ./jobgate.cfg if present)\n"
           "  -h, --help                 this text\n";
}
