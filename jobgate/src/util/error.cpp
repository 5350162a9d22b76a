#include "util/error.hpp"

#include <cstdlib>
#include <iostream>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <unistd.h>

void die(const std::string& message, int status) {
    std::cerr << "jobgate: " << message << std::endl;
    std::exit(status);
}

void logErrno(const std::string& message) {
    int savedErrno = errno;
    std::string line = "jobgate[" + std::to_string(getpid()) + "]: ";
    if (!message.empty()) {
        line += message + ": ";
    }
    line += std::strerror(savedErrno);
    std::cerr << line << std::endl;
    errno = savedErrno;
}
