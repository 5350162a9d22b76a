#pragma once

#include <string>

struct Config {
    int maxConcurrentJobs;      // MAX_CONCURRENT_JOBS, > 0
    int retryIntervalMs;        // RETRY_INTERVAL (s) / RETRY_INTERVAL_MS, >= 0
    int acquireTimeoutMs;       // ACQUIRE_TIMEOUT (s), 0 = wait forever
    std::string semaphoreFile;  // SEMAPHORE_FILE
    std::string logFile;        // LOG_FILE, empty = stderr
    int quiet;                  // 0/1 toggle, errors and warnings only
    int writeGitignore;         // 0/1 toggle, drop a '*' .gitignore beside the lock dir
};

/** @brief Default config file looked up in the working directory when --config is absent. */
extern const char* const kDefaultConfigFile;

/** @brief Fill every field with its built-in default. */
void applyDefaults(Config& cfg);

/**
 * @brief Apply one key/value setting using config-file key names.
 * @param cfg destination.
 * @param key e.g. MAX_CONCURRENT_JOBS.
 * @param value raw text.
 * @param err error message when the value does not parse.
 * @return false on a bad value; unknown keys are ignored and return true.
 */
bool applySetting(Config& cfg, const std::string& key, const std::string& value, std::string& err);

/**
 * @brief Load key = value pairs from a config file on top of cfg.
 * @param path path to config file.
 * @param cfg destination structure, already holding defaults.
 * @param err error message on failure.
 * @return true if the file was read and every known key parsed.
 */
bool parseConfigFile(const std::string& path, Config& cfg, std::string& err);

/**
 * @brief Override cfg from the process environment (MAX_CONCURRENT_JOBS, RETRY_INTERVAL, ...).
 * @return false if a set variable holds an unparsable value.
 */
bool applyEnvironment(Config& cfg, std::string& err);

/**
 * @brief Range checks once every source has been applied.
 * @return true if valid, otherwise false with err set.
 */
bool validateConfig(const Config& cfg, std::string& err);
