#pragma once
#include <optional>
#include <string>

// RAII per-configuration lock. Ensures only one daemon serves a config file.
// Uses flock() on Unix, LockFileEx() on Windows.
// Lock is automatically released when the process exits (even on crash).
class SingletonLock {
public:
    // Attempts to acquire the lock. Check held() after construction.
    explicit SingletonLock(const std::string& lock_path);
    ~SingletonLock();

    SingletonLock(const SingletonLock&) = delete;
    SingletonLock& operator=(const SingletonLock&) = delete;

    // Returns true if this instance holds the lock.
    bool held() const { return fd_ >= 0; }

    const std::string& path() const { return path_; }

    // Pid written by whoever holds the lock, if readable.
    std::optional<int> holder_pid() const;

private:
    int fd_ = -1;
    std::string path_;
};
