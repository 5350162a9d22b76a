#pragma once

#include <string>

#include <cstdlib>

/**
 * @brief Print a message and terminate the process.
 *
 * Goes through std::exit, so atexit hooks (the release guard among them) still run.
 * @param status process exit status.
 */
[[noreturn]] void die(const std::string& message, int status = EXIT_FAILURE);

/**
 * @brief Log a message along with errno details.
 */
void logErrno(const std::string& message);
