#pragma once

#include <atomic>
#include <cstddef>
#include <string>

#include "ipc/fifo.hpp"
#include "ipc/line_reader.hpp"
#include "logging/syslog_sink.hpp"
#include "model/pipe_spec.hpp"
#include "util/error.hpp"

/**
 * @brief Forwards the lines of one FIFO to syslog under one priority and tag.
 *
 * Lifecycle: resolve() -> open() -> forwardStream() repeatedly. run() does all
 * of it and only returns when the worker fails.
 */
class ForwardingWorker {
public:
    /**
     * @param spec pipe to serve.
     * @param syslogSocket explicit log socket path, empty for the default endpoints.
     */
    explicit ForwardingWorker(PipeSpec spec, std::string syslogSocket = std::string());

    ForwardingWorker(const ForwardingWorker&) = delete;
    ForwardingWorker& operator=(const ForwardingWorker&) = delete;

    /**
     * @brief Validate the spec and compute the encoded priority.
     * @return false with an ErrorKind::Configuration failure on a bad spec.
     */
    bool resolve(Failure& failure);

    /**
     * @brief Connect to syslog, then create/open the FIFO.
     *
     * Blocks until a writer opens the FIFO.
     */
    bool open(Failure& failure);

    /**
     * @brief Forward records until the current writer goes away.
     * @return true at end of stream, false on a read or write error.
     */
    bool forwardStream(Failure& failure);

    /**
     * @brief Resolve, open, then forward forever, reopening the FIFO after each writer.
     * @return the failure that stopped the worker.
     */
    Failure run();

    const PipeSpec& spec() const { return spec_; }

    /** @brief Encoded priority, valid after resolve(). */
    int priority() const { return priority_; }

    /** @brief Records handed to syslog so far. */
    std::size_t forwardedCount() const { return forwarded_.load(); }

private:
    PipeSpec spec_;
    std::string syslogSocket_;
    int priority_;
    bool resolved_;
    Fifo fifo_;
    LineReader reader_;
    SyslogConnection syslog_;
    std::atomic<std::size_t> forwarded_;
};
