#include "atomic_file.hpp"

#include "devcfg/core/errors.hpp"
#include "devcfg/core/logging.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace devcfg::normalize {

namespace fs = std::filesystem;

namespace {

std::string temp_path_for(const std::string& path) {
    return path + ".tmp-" + std::to_string(static_cast<long>(::getpid()));
}

// std::ofstream has no fsync; reopen the finished temp file to flush it.
void sync_to_disk(const std::string& path) {
    const int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw FilesystemError("cannot reopen " + path + " for fsync: " + std::strerror(errno));
    }
    const int rc = ::fsync(fd);
    const int saved = errno;
    ::close(fd);
    if (rc != 0) {
        throw FilesystemError("fsync failed for " + path + ": " + std::strerror(saved));
    }
}

void discard_temp(const std::string& tmp) {
    std::error_code ec;
    fs::remove(tmp, ec);
    if (ec) log_warn("atomic write: could not remove temp file " + tmp + ": " + ec.message());
}

} // namespace

void write_file_atomic(const std::string& path, std::string_view data) {
    const std::string tmp = temp_path_for(path);

    try {
        {
            std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
            if (!f.good()) {
                throw FilesystemError("cannot create temp file " + tmp);
            }
            f.write(data.data(), static_cast<std::streamsize>(data.size()));
            f.flush();
            if (!f.good()) {
                throw FilesystemError("write failed for temp file " + tmp);
            }
        }
        sync_to_disk(tmp);

        std::error_code ec;
        fs::rename(tmp, path, ec);
        if (ec) {
            throw FilesystemError("cannot replace " + path + ": " + ec.message());
        }
    } catch (const FilesystemError&) {
        discard_temp(tmp);
        throw;
    }
}

std::string read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.good()) {
        throw FilesystemError("cannot open " + path);
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        throw FilesystemError("read failed for " + path);
    }
    return ss.str();
}

std::optional<std::string> read_file_if_exists(const std::string& path) {
    std::error_code ec;
    const bool exists = fs::exists(path, ec);
    if (ec) {
        throw FilesystemError("cannot stat " + path + ": " + ec.message());
    }
    if (!exists) return std::nullopt;
    return read_file(path);
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        log_warn("cannot remove " + path + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace devcfg::normalize
