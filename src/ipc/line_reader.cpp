#include "ipc/line_reader.hpp"

#include <cerrno>
#include <unistd.h>

namespace {
constexpr size_t kReadChunk = 4096;
} // namespace

LineReader::LineReader(int fd) : fd_(fd), start_(0) {}

void LineReader::reset(int fd) {
    fd_ = fd;
    buffer_.clear();
    start_ = 0;
}

ReadStatus LineReader::next(std::string& record, Failure& failure) {
    while (true) {
        auto nl = buffer_.find('\n', start_);
        if (nl != std::string::npos) {
            record.assign(buffer_, start_, nl - start_);
            start_ = nl + 1;
            return ReadStatus::Record;
        }

        // Compact before reading more so the buffer only holds the partial line.
        if (start_ > 0) {
            buffer_.erase(0, start_);
            start_ = 0;
        }

        bool eof = false;
        if (!fill(failure, eof)) {
            return ReadStatus::Error;
        }
        if (eof) {
            if (buffer_.empty()) {
                return ReadStatus::EndOfStream;
            }
            record.swap(buffer_);
            buffer_.clear();
            return ReadStatus::Record;
        }
    }
}

bool LineReader::fill(Failure& failure, bool& eof) {
    char chunk[kReadChunk];
    ssize_t n = -1;
    do {
        n = ::read(fd_, chunk, sizeof(chunk));
    } while (n == -1 && errno == EINTR);

    if (n == -1) {
        return fail(failure, ErrorKind::Io, errnoMessage("Reading from pipe failed"));
    }
    eof = (n == 0);
    buffer_.append(chunk, static_cast<size_t>(n));
    return true;
}
