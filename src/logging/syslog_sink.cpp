#include "logging/syslog_sink.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <initializer_list>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace {
constexpr std::array<const char*, 3> kDefaultEndpoints = {
    "/dev/log",
    "/var/run/syslog",
    "/var/run/log",
};

bool fillAddress(const std::string& path, struct sockaddr_un& addr) {
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) {
        return false;
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    return true;
}
} // namespace

std::string formatSyslogMessage(int priority, const std::string& tag, const std::string& record) {
    char stamp[32] = {0};
    std::time_t now = std::time(nullptr);
    struct tm local {};
    if (localtime_r(&now, &local) != nullptr) {
        std::strftime(stamp, sizeof(stamp), "%b %e %H:%M:%S", &local);
    }

    std::string message = "<" + std::to_string(priority) + ">" + stamp + " " + tag + "["
                        + std::to_string(static_cast<long>(getpid())) + "]: ";
    message += record;
    return message;
}

SyslogConnection::SyslogConnection() : fd_(-1), stream_(false) {}

SyslogConnection::~SyslogConnection() {
    close();
}

bool SyslogConnection::connectTo(const std::string& path, int& savedErrno) {
    struct sockaddr_un addr {};
    if (!fillAddress(path, addr)) {
        savedErrno = ENAMETOOLONG;
        return false;
    }

    // Datagram first; a stream-only daemon answers EPROTOTYPE.
    for (int type : {SOCK_DGRAM, SOCK_STREAM}) {
        int sock = ::socket(AF_UNIX, type | SOCK_CLOEXEC, 0);
        if (sock == -1) {
            savedErrno = errno;
            return false;
        }
        if (::connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0) {
            fd_ = sock;
            stream_ = (type == SOCK_STREAM);
            endpoint_ = path;
            return true;
        }
        savedErrno = errno;
        ::close(sock);
        if (savedErrno != EPROTOTYPE) {
            return false;
        }
    }
    return false;
}

bool SyslogConnection::open(const std::string& tag, Failure& failure, const std::string& socketPath) {
    if (fd_ != -1) {
        close();
    }
    tag_ = tag;

    int savedErrno = 0;
    if (!socketPath.empty()) {
        if (connectTo(socketPath, savedErrno)) {
            return true;
        }
        return fail(failure, ErrorKind::Io,
                    "connect to syslog at " + socketPath + " failed: " + std::strerror(savedErrno));
    }
    for (const char* candidate : kDefaultEndpoints) {
        if (connectTo(candidate, savedErrno)) {
            return true;
        }
    }
    return fail(failure, ErrorKind::Io,
                std::string("Unix syslog delivery error: ") + std::strerror(savedErrno));
}

bool SyslogConnection::write(int priority, const std::string& record, Failure& failure) {
    if (fd_ == -1) {
        return fail(failure, ErrorKind::Io, "Writing to syslog failed: connection not open");
    }
    std::string message = formatSyslogMessage(priority, tag_, record);
    if (stream_) {
        // Stream daemons split messages on NUL, as glibc's syslog(3) sends them.
        message.push_back('\0');
    }

    size_t offset = 0;
    while (offset < message.size()) {
        ssize_t sent = ::send(fd_, message.data() + offset, message.size() - offset, MSG_NOSIGNAL);
        if (sent == -1) {
            if (errno == EINTR) {
                continue;
            }
            return fail(failure, ErrorKind::Io, errnoMessage("Writing to syslog failed"));
        }
        // Datagrams go out whole; only a stream socket can send short.
        offset += stream_ ? static_cast<size_t>(sent) : message.size();
    }
    return true;
}

void SyslogConnection::close() {
    if (fd_ != -1) {
        if (::close(fd_) == -1) {
            logErrno("close syslog socket " + endpoint_);
        }
        fd_ = -1;
    }
    endpoint_.clear();
}
