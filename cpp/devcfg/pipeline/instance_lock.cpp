#include "instance_lock.hpp"

#include "devcfg/core/errors.hpp"
#include "devcfg/core/logging.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace devcfg::pipeline {

InstanceLock::InstanceLock(std::string path) : path_(std::move(path)) {
    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw FilesystemError("cannot open lock file " + path_ + ": " + std::strerror(errno));
    }
    if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        const int saved = errno;
        ::close(fd_);
        fd_ = -1;
        if (saved == EWOULDBLOCK) {
            throw BusyError("another run holds " + path_ + "; refusing to run concurrently");
        }
        throw FilesystemError("cannot lock " + path_ + ": " + std::strerror(saved));
    }
    log_debug("lock: acquired " + path_);
}

InstanceLock::~InstanceLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

} // namespace devcfg::pipeline
