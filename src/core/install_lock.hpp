#pragma once

#include <string>

/// Exclusive, non-blocking, cross-process install lock backed by flock(2)
/// on a marker file. Released on destruction or process exit.
class InstallLock {
public:
    explicit InstallLock(const std::string& lock_path);
    ~InstallLock();

    InstallLock(const InstallLock&) = delete;
    InstallLock& operator=(const InstallLock&) = delete;

    /// Try to take the lock without waiting. Returns false if another
    /// process (or another InstallLock in this process) holds it.
    bool try_acquire();

    void release();

    bool held() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }
    const std::string& error() const { return error_; }

private:
    std::string path_;
    std::string error_;
    int fd_ = -1;
};
