#pragma once

#include <string>

#include "util/error.hpp"

/**
 * @brief Read end of a named pipe, created on demand.
 *
 * Use open() once; reopen() after end of stream to wait for the next writer.
 * The descriptor is closed by the destructor.
 */
class Fifo {
public:
    /** @brief Construct an empty handle (fd = -1). */
    Fifo();
    ~Fifo();

    Fifo(const Fifo&) = delete;
    Fifo& operator=(const Fifo&) = delete;

    /**
     * @brief Make sure a FIFO exists at path without opening it.
     *
     * A missing path is created with mode 0666. An existing FIFO is left as
     * is. Any other file type is refused and left untouched.
     * @param path filesystem path.
     * @param failure PathConflict or Io on error.
     * @return true if a FIFO is now present at path.
     */
    static bool ensureNode(const std::string& path, Failure& failure);

    /**
     * @brief ensureNode() then open the FIFO for reading.
     *
     * Blocks until a writer attaches.
     * @return true on success, false on failure.
     */
    bool open(const std::string& path, Failure& failure);

    /**
     * @brief Close and open the same path again (blocks for the next writer).
     */
    bool reopen(Failure& failure);

    /** @brief Close the descriptor if open. */
    void close();

    /** @brief Underlying descriptor, or -1 if not open. */
    int fd() const;

    const std::string& path() const { return path_; }

private:
    int fd_;
    std::string path_;
};
