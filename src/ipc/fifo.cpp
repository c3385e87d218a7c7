#include "ipc/fifo.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace {
constexpr mode_t kFifoMode = 0666;
} // namespace

Fifo::Fifo() : fd_(-1) {}

Fifo::~Fifo() {
    close();
}

bool Fifo::ensureNode(const std::string& path, Failure& failure) {
    struct stat st {};
    if (::stat(path.c_str(), &st) == 0) {
        if (S_ISFIFO(st.st_mode)) {
            return true;
        }
        return fail(failure, ErrorKind::PathConflict,
                    path + " exists, but it's not a named pipe (FIFO)");
    }
    if (errno != ENOENT) {
        return fail(failure, ErrorKind::Io, errnoMessage("stat " + path));
    }

    if (::mkfifo(path.c_str(), kFifoMode) == -1) {
        return fail(failure, ErrorKind::Io, errnoMessage("mkfifo " + path));
    }
    // mkfifo honours the umask; writers of any user must be able to attach.
    if (::chmod(path.c_str(), kFifoMode) == -1) {
        return fail(failure, ErrorKind::Io, errnoMessage("chmod " + path));
    }
    return true;
}

bool Fifo::open(const std::string& path, Failure& failure) {
    close();
    if (!ensureNode(path, failure)) {
        return false;
    }
    path_ = path;

    int fd = -1;
    do {
        fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } while (fd == -1 && errno == EINTR);
    if (fd == -1) {
        return fail(failure, ErrorKind::Io, errnoMessage("open " + path));
    }
    fd_ = fd;
    return true;
}

bool Fifo::reopen(Failure& failure) {
    if (path_.empty()) {
        return fail(failure, ErrorKind::Io, "Fifo::reopen called before open");
    }
    std::string path = path_;
    return open(path, failure);
}

void Fifo::close() {
    if (fd_ != -1) {
        if (::close(fd_) == -1) {
            logErrno("close " + path_);
        }
        fd_ = -1;
    }
}

int Fifo::fd() const {
    return fd_;
}
