#pragma once

#include <string>

namespace devcfg::pipeline {

// Advisory, non-blocking flock() on a lock file next to the canonical
// artifact. Held for the lifetime of the object; the kernel drops it if the
// process dies. Throws BusyError when another run holds it, FilesystemError
// when the lock file cannot be opened.
class InstanceLock final {
public:
    explicit InstanceLock(std::string path);
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
    int fd_ = -1;
};

} // namespace devcfg::pipeline
