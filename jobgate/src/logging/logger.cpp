#include "logging/logger.hpp"

#include "util/error.hpp"

#include <fcntl.h>
#include <string>
#include <unistd.h>
#include <cerrno>
#include <ctime>

Logger::Logger() : fd(STDERR_FILENO), ownsFd(false) {}

Logger::~Logger() {
    closeFile();
}

bool Logger::openFile(const std::string& path) {
    int newFd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (newFd == -1) {
        logErrno("open log file failed: " + path);
        return false;
    }
    closeFile();
    fd = newFd;
    ownsFd = true;
    return true;
}

void Logger::logLine(const std::string& line) {
    std::string withNewline = line;
    withNewline.push_back('\n');
    // O_APPEND keeps lines from concurrent processes whole.
    ssize_t written;
    do {
        written = ::write(fd, withNewline.data(), withNewline.size());
    } while (written == -1 && errno == EINTR);
    if (written == -1) {
        logErrno("write log line failed");
    }
}

void Logger::closeFile() {
    if (ownsFd && fd != -1) {
        ::close(fd);
    }
    fd = STDERR_FILENO;
    ownsFd = false;
}

namespace {
bool g_quiet = false;

Logger& processLogger() {
    static Logger logger;
    return logger;
}

std::string timestamp() {
    std::time_t now = std::time(nullptr);
    struct tm local {};
    char buf[32] = {0};
    if (localtime_r(&now, &local) == nullptr ||
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &local) == 0) {
        return std::to_string(static_cast<long long>(now));
    }
    return buf;
}

// Semicolon-separated line for easy grepping across many concurrent jobs:
// timestamp;pid;role;text
std::string formatLine(Role role, const std::string& text) {
    return timestamp() + ";" + std::to_string(getpid()) + ";" + roleLabel(role) + ";" + text;
}
} // namespace

const char* roleLabel(Role role) {
    switch (role) {
        case Role::Gate: return "gate";
        case Role::Store: return "store";
        case Role::AcquireLoop: return "acquire";
        case Role::Guard: return "guard";
        case Role::Workload: return "workload";
        default: return "unknown";
    }
}

bool openLog(const std::string& path) {
    if (path.empty()) {
        processLogger().closeFile();
        return true;
    }
    return processLogger().openFile(path);
}

void closeLog() {
    processLogger().closeFile();
}

void setLogQuiet(bool quiet) {
    g_quiet = quiet;
}

void logEvent(Role role, const std::string& text) {
    if (g_quiet) {
        return;
    }
    processLogger().logLine(formatLine(role, text));
}

void logWarning(Role role, const std::string& text) {
    processLogger().logLine(formatLine(role, "WARN " + text));
}
