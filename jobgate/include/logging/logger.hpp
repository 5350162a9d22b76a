#pragma once

#include <string>

#include "model/types.hpp"

/**
 * @brief Dedicated logger writing text lines to a file descriptor.
 */
class Logger {
public:
    /** @brief Default constructor writes to stderr. */
    Logger();

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Open or create the log file in append mode.
     * @param path file path.
     * @return true on success, false on failure (logger stays on its previous target).
     */
    bool openFile(const std::string& path);

    /**
     * @brief Write one log line (a newline is appended).
     * @param line text to write.
     */
    void logLine(const std::string& line);

    /**
     * @brief Close the file descriptor if it is a file we opened; falls back to stderr.
     */
    void closeFile();

private:
    int fd;
    bool ownsFd;
};

/**
 * @brief Route process-wide log output to a file (append) or, for an empty path, stderr.
 * @return true on success, false if the file could not be opened.
 */
bool openLog(const std::string& path);

/** @brief Close a log file opened by openLog and return to stderr. */
void closeLog();

/** @brief Suppress informational lines; warnings still go through. */
void setLogQuiet(bool quiet);

/**
 * @brief Write an informational line: timestamp;pid;role;text
 * @param role component emitting the line.
 * @param text text payload.
 */
void logEvent(Role role, const std::string& text);

/** @brief Same format as logEvent, tagged WARN, never suppressed by quiet mode. */
void logWarning(Role role, const std::string& text);

/** @brief Short lowercase label used for the role column. */
const char* roleLabel(Role role);
