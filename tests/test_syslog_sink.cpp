#include "logging/syslog_sink.hpp"

#include "test_support.hpp"

#include <syslog.h>

#include <cassert>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using testsupport::SinkSocket;
using testsupport::TempDir;
using testsupport::endsWith;
using testsupport::startsWith;

namespace {

std::string pidSuffix(const std::string& tag, const std::string& record) {
    return " " + tag + "[" + std::to_string(static_cast<long>(getpid())) + "]: " + record;
}

void testFormat() {
    std::string message = formatSyslogMessage(LOG_LOCAL6 | LOG_INFO, "nginx", "GET / 200");
    assert(startsWith(message, "<182>"));
    assert(endsWith(message, pidSuffix("nginx", "GET / 200")));
    // "<182>" + "Mmm dd hh:mm:ss" (15 chars) + " nginx[..."
    assert(message[5 + 15] == ' ');
}

void testWriteReachesSocket() {
    TempDir dir;
    assert(dir.ok());
    SinkSocket sink(dir.file("log.sock"));
    assert(sink.ok());

    SyslogConnection connection;
    Failure failure;
    assert(connection.open("app", failure, dir.file("log.sock")));
    assert(connection.isOpen());
    assert(connection.endpoint() == dir.file("log.sock"));

    assert(connection.write(LOG_DAEMON | LOG_ERR, "first", failure));
    assert(connection.write(LOG_DAEMON | LOG_DEBUG, "second", failure));

    std::string message;
    assert(sink.receive(message, 2000));
    assert(startsWith(message, "<" + std::to_string(LOG_DAEMON | LOG_ERR) + ">"));
    assert(endsWith(message, pidSuffix("app", "first")));
    assert(sink.receive(message, 2000));
    assert(startsWith(message, "<" + std::to_string(LOG_DAEMON | LOG_DEBUG) + ">"));
    assert(endsWith(message, pidSuffix("app", "second")));

    connection.close();
    assert(!connection.isOpen());
    assert(connection.endpoint().empty());
}

void testStreamSocketMessagesEndWithNul() {
    TempDir dir;
    const std::string path = dir.file("stream.sock");
    int listener = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    assert(listener != -1);
    struct sockaddr_un addr {};
    addr.sun_family = AF_UNIX;
    assert(path.size() < sizeof(addr.sun_path));
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    assert(::bind(listener, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0);
    assert(::listen(listener, 1) == 0);

    // The datagram connect gets EPROTOTYPE; the connection falls back to a stream.
    SyslogConnection connection;
    Failure failure;
    assert(connection.open("app", failure, path));
    assert(connection.write(LOG_LOCAL6 | LOG_INFO, "payload", failure));
    connection.close();

    int peer = ::accept(listener, nullptr, nullptr);
    assert(peer != -1);
    std::string received;
    char buf[512];
    ssize_t n = 0;
    while ((n = ::recv(peer, buf, sizeof(buf), 0)) != 0) {
        if (n == -1 && errno == EINTR) {
            continue;
        }
        assert(n > 0);
        received.append(buf, static_cast<size_t>(n));
    }
    ::close(peer);
    ::close(listener);

    assert(!received.empty());
    assert(received.back() == '\0');
    received.pop_back();
    assert(received.find('\n') == std::string::npos);
    assert(startsWith(received, "<182>"));
    assert(endsWith(received, pidSuffix("app", "payload")));
}

void testOpenFailureIsIo() {
    TempDir dir;
    SyslogConnection connection;
    Failure failure;
    assert(!connection.open("app", failure, dir.file("nobody-listens.sock")));
    assert(failure.kind == ErrorKind::Io);
    assert(failure.message.find(dir.file("nobody-listens.sock")) != std::string::npos);
    assert(!connection.isOpen());
}

void testWriteWhenClosedIsIo() {
    SyslogConnection connection;
    Failure failure;
    assert(!connection.write(LOG_USER | LOG_INFO, "lost", failure));
    assert(failure.kind == ErrorKind::Io);
}

} // namespace

int main() {
    testFormat();
    testWriteReachesSocket();
    testStreamSocketMessagesEndWithNul();
    testOpenFailureIsIo();
    testWriteWhenClosedIsIo();
    std::cout << "syslog sink test ok\n";
    return 0;
}
