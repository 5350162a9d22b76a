#include "model/config.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

const char* const kDefaultConfigFile = "jobgate.cfg";

namespace {
std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

int parseInt(const std::string& val) {
    size_t used = 0;
    int out = std::stoi(val, &used);
    if (used != val.size()) {
        throw std::invalid_argument(val);
    }
    return out;
}

// Seconds may be fractional ("0.5"); stored as milliseconds.
int parseSecondsAsMs(const std::string& val) {
    size_t used = 0;
    double seconds = std::stod(val, &used);
    if (used != val.size() || !std::isfinite(seconds)) {
        throw std::invalid_argument(val);
    }
    double ms = seconds * 1000.0;
    if (ms > std::numeric_limits<int>::max() || ms < std::numeric_limits<int>::min()) {
        throw std::out_of_range(val);
    }
    return static_cast<int>(std::lround(ms));
}

bool parseFlag(const std::string& val) {
    if (val == "1" || val == "true" || val == "yes" || val == "on") return true;
    if (val == "0" || val == "false" || val == "no" || val == "off" || val.empty()) return false;
    throw std::invalid_argument(val);
}

struct EnvBinding {
    const char* envName;
    const char* key;
};

// Environment names; the two limits keep the bare names the shell scripts used.
const EnvBinding kEnvBindings[] = {
    {"MAX_CONCURRENT_JOBS", "MAX_CONCURRENT_JOBS"},
    {"RETRY_INTERVAL", "RETRY_INTERVAL"},
    {"RETRY_INTERVAL_MS", "RETRY_INTERVAL_MS"},
    {"ACQUIRE_TIMEOUT", "ACQUIRE_TIMEOUT"},
    {"SEMAPHORE_FILE", "SEMAPHORE_FILE"},
    {"JOBGATE_LOG_FILE", "LOG_FILE"},
    {"JOBGATE_QUIET", "QUIET"},
    {"JOBGATE_WRITE_GITIGNORE", "WRITE_GITIGNORE"},
};
} // namespace

void applyDefaults(Config& cfg) {
    cfg.maxConcurrentJobs = 1;
    cfg.retryIntervalMs = 5000;
    cfg.acquireTimeoutMs = 0;
    cfg.semaphoreFile = "./tmp/locks/semaphore.lock";
    cfg.logFile.clear();
    cfg.quiet = 0;
    cfg.writeGitignore = 1;
}

bool applySetting(Config& cfg, const std::string& key, const std::string& rawValue, std::string& err) {
    std::string val = trim(rawValue);
    try {
        if (key == "MAX_CONCURRENT_JOBS") cfg.maxConcurrentJobs = parseInt(val);
        else if (key == "RETRY_INTERVAL") cfg.retryIntervalMs = parseSecondsAsMs(val);
        else if (key == "RETRY_INTERVAL_MS") cfg.retryIntervalMs = parseInt(val);
        else if (key == "ACQUIRE_TIMEOUT") cfg.acquireTimeoutMs = parseSecondsAsMs(val);
        else if (key == "SEMAPHORE_FILE") cfg.semaphoreFile = val;
        else if (key == "LOG_FILE") cfg.logFile = val;
        else if (key == "QUIET") cfg.quiet = parseFlag(val) ? 1 : 0;
        else if (key == "WRITE_GITIGNORE") cfg.writeGitignore = parseFlag(val) ? 1 : 0;
    } catch (const std::exception&) {
        err = "Invalid value for key: " + key + " (" + val + ")";
        return false;
    }
    return true;
}

bool parseConfigFile(const std::string& path, Config& cfg, std::string& err) {
    std::ifstream in(path);
    if (!in) {
        err = "Cannot open config file: " + path;
        return false;
    }

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) continue;
        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));
        if (!applySetting(cfg, key, val, err)) {
            err = path + ": " + err;
            return false;
        }
    }
    return true;
}

bool applyEnvironment(Config& cfg, std::string& err) {
    for (const auto& binding : kEnvBindings) {
        const char* value = std::getenv(binding.envName);
        if (value == nullptr) continue;
        if (!applySetting(cfg, binding.key, value, err)) {
            err = std::string("environment ") + binding.envName + ": " + err;
            return false;
        }
    }
    return true;
}

bool validateConfig(const Config& cfg, std::string& err) {
    if (cfg.maxConcurrentJobs <= 0) {
        err = "MAX_CONCURRENT_JOBS must be > 0";
        return false;
    }
    if (cfg.retryIntervalMs < 0) {
        err = "RETRY_INTERVAL must be >= 0";
        return false;
    }
    if (cfg.acquireTimeoutMs < 0) {
        err = "ACQUIRE_TIMEOUT must be >= 0";
        return false;
    }
    if (cfg.semaphoreFile.empty()) {
        err = "SEMAPHORE_FILE must not be empty";
        return false;
    }
    return true;
}
