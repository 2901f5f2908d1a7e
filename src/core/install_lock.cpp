#include "core/install_lock.hpp"

#include <sys/file.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

InstallLock::InstallLock(const std::string& lock_path) : path_(lock_path) {}

InstallLock::~InstallLock() {
    release();
}

bool InstallLock::try_acquire() {
    if (fd_ >= 0) return true;
    error_.clear();

    std::error_code ec;
    auto parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            error_ = "cannot create " + parent.string() + ": " + ec.message();
            return false;
        }
    }

    int fd = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        error_ = "open " + path_ + ": " + std::strerror(errno);
        return false;
    }

    // flock locks belong to the open file description, so a second open()
    // in the same process is refused as well
    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        error_ = (errno == EWOULDBLOCK) ? "held by another launcher"
                                        : std::string("flock: ") + std::strerror(errno);
        close(fd);
        return false;
    }

    // Informational only: the pid of the holder
    std::string pid = std::to_string(getpid()) + "\n";
    if (ftruncate(fd, 0) == 0) {
        ssize_t written = write(fd, pid.data(), pid.size());
        (void)written;
    }

    fd_ = fd;
    return true;
}

void InstallLock::release() {
    if (fd_ < 0) return;
    flock(fd_, LOCK_UN);
    close(fd_);
    fd_ = -1;
}
