#include "worker/forwarding_worker.hpp"

#include <utility>

ForwardingWorker::ForwardingWorker(PipeSpec spec, std::string syslogSocket)
    : spec_(std::move(spec)),
      syslogSocket_(std::move(syslogSocket)),
      priority_(0),
      resolved_(false),
      forwarded_(0) {}

bool ForwardingWorker::resolve(Failure& failure) {
    resolved_ = validatePipeSpec(spec_, priority_, failure);
    return resolved_;
}

bool ForwardingWorker::open(Failure& failure) {
    if (!resolved_ && !resolve(failure)) {
        return false;
    }
    // Sink first: a dead syslog should not wait for the first writer to show up.
    if (!syslog_.open(spec_.tag, failure, syslogSocket_)) {
        return false;
    }
    if (!fifo_.open(spec_.path, failure)) {
        return false;
    }
    reader_.reset(fifo_.fd());
    return true;
}

bool ForwardingWorker::forwardStream(Failure& failure) {
    std::string record;
    while (true) {
        switch (reader_.next(record, failure)) {
            case ReadStatus::EndOfStream:
                return true;
            case ReadStatus::Error:
                failure.message = spec_.path + ": " + failure.message;
                return false;
            case ReadStatus::Record:
                break;
        }
        // Empty lines carry nothing worth a syslog entry.
        if (record.empty()) {
            continue;
        }
        if (!syslog_.write(priority_, record, failure)) {
            failure.message = spec_.path + ": " + failure.message;
            return false;
        }
        forwarded_.fetch_add(1);
    }
}

Failure ForwardingWorker::run() {
    Failure failure;
    if (!resolve(failure) || !open(failure)) {
        return failure;
    }
    while (true) {
        if (!forwardStream(failure)) {
            return failure;
        }
        // The writer closed its end; block until the next one opens the FIFO.
        if (!fifo_.reopen(failure)) {
            return failure;
        }
        reader_.reset(fifo_.fd());
    }
}
