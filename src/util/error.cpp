#include "util/error.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <mutex>

namespace {
std::mutex& stderrMutex() {
    static std::mutex mutex;
    return mutex;
}
} // namespace

bool fail(Failure& failure, ErrorKind kind, const std::string& message) {
    failure.kind = kind;
    failure.message = message;
    return false;
}

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Configuration: return "config";
        case ErrorKind::PathConflict: return "path";
        case ErrorKind::Io: return "io";
    }
    return "unknown";
}

std::string errnoMessage(const std::string& message) {
    int saved = errno;
    if (message.empty()) {
        return std::strerror(saved);
    }
    return message + ": " + std::strerror(saved);
}

void logError(const std::string& message) {
    std::lock_guard<std::mutex> lock(stderrMutex());
    std::cerr << "logpipe: " << message << std::endl;
}

void logErrno(const std::string& message) {
    logError(errnoMessage(message));
}
