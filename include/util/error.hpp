#pragma once

#include <string>

/**
 * @brief Failure categories reported by workers and configuration loading.
 */
enum class ErrorKind {
    None,
    Configuration,
    PathConflict,
    Io
};

/**
 * @brief Terminal error carried back to the caller (kind plus readable text).
 */
struct Failure {
    ErrorKind kind{ErrorKind::None};
    std::string message;
};

/**
 * @brief Fill a Failure and return false, so callers can `return fail(...)`.
 */
bool fail(Failure& failure, ErrorKind kind, const std::string& message);

/** @brief Short lowercase name of an error kind ("config", "path", "io"). */
const char* errorKindName(ErrorKind kind);

/**
 * @brief Build "message: strerror(errno)" from the current errno.
 */
std::string errnoMessage(const std::string& message);

/**
 * @brief Write one diagnostic line to stderr; safe to call from several threads.
 */
void logError(const std::string& message);

/**
 * @brief Log a message along with errno details.
 */
void logErrno(const std::string& message);
