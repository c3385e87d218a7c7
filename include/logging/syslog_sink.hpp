#pragma once

#include <string>

#include "util/error.hpp"

/**
 * @brief Connection to the local syslog daemon carrying one fixed tag.
 *
 * Each forwarding worker owns its own connection, so different pipes can use
 * different tags at the same time (openlog(3) only has one per process).
 */
class SyslogConnection {
public:
    /** @brief Default constructor leaves the socket closed. */
    SyslogConnection();
    ~SyslogConnection();

    SyslogConnection(const SyslogConnection&) = delete;
    SyslogConnection& operator=(const SyslogConnection&) = delete;

    /**
     * @brief Connect to the local log socket.
     * @param tag identifier placed in front of every message.
     * @param failure Io failure if no endpoint accepts the connection.
     * @param socketPath explicit AF_UNIX path; empty tries /dev/log,
     *        /var/run/syslog and /var/run/log in that order.
     * @return true on success, false on failure.
     */
    bool open(const std::string& tag, Failure& failure, const std::string& socketPath = std::string());

    /**
     * @brief Send one record at the given encoded priority.
     * @param priority facility | severity.
     * @param record message text, without trailing newline.
     * @return true on success, false on failure (not retried).
     */
    bool write(int priority, const std::string& record, Failure& failure);

    /**
     * @brief Close the socket if open.
     */
    void close();

    bool isOpen() const { return fd_ != -1; }

    /** @brief Endpoint actually connected to, empty while closed. */
    const std::string& endpoint() const { return endpoint_; }

private:
    bool connectTo(const std::string& path, int& savedErrno);

    int fd_;
    bool stream_;
    std::string tag_;
    std::string endpoint_;
};

/**
 * @brief Render one message the way the C library's syslog(3) frames it locally.
 *
 * Produces "<PRI>Mmm dd hh:mm:ss TAG[PID]: record". write() appends a NUL
 * terminator on stream sockets; datagrams carry no terminator.
 */
std::string formatSyslogMessage(int priority, const std::string& tag, const std::string& record);
