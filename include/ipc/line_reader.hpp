#pragma once

#include <string>

#include "util/error.hpp"

enum class ReadStatus {
    Record,
    EndOfStream,
    Error
};

/**
 * @brief Splits a byte stream read from a descriptor into newline-terminated records.
 *
 * The descriptor is borrowed, not owned.
 */
class LineReader {
public:
    explicit LineReader(int fd = -1);

    /**
     * @brief Produce the next record without its trailing '\n'.
     *
     * An unterminated tail is returned once as a Record when the writer goes
     * away; the call after that reports EndOfStream. Empty lines come back as
     * empty records.
     * @param record receives the record bytes.
     * @param failure Io failure when the read itself fails.
     */
    ReadStatus next(std::string& record, Failure& failure);

    /** @brief Switch to another descriptor and drop anything buffered. */
    void reset(int fd);

private:
    bool fill(Failure& failure, bool& eof);

    int fd_;
    std::string buffer_;
    size_t start_;
};
