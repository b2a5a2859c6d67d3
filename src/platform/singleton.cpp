#include "singleton.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#ifdef _WIN32
#  include <windows.h>
#  include <io.h>
#  include <fcntl.h>
#else
#  include <sys/file.h>
#  include <unistd.h>
#  include <fcntl.h>
#endif

SingletonLock::SingletonLock(const std::string& lock_path) : path_(lock_path) {
    // Ensure parent directory exists
    std::error_code ec;
    auto parent = std::filesystem::path(lock_path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

#ifdef _WIN32
    fd_ = _open(lock_path.c_str(), _O_CREAT | _O_RDWR, 0644);
    if (fd_ < 0) return;
    HANDLE h = (HANDLE)_get_osfhandle(fd_);
    OVERLAPPED ov = {};
    if (!LockFileEx(h, LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY,
                    0, 1, 0, &ov)) {
        _close(fd_);
        fd_ = -1;
    }
#else
    fd_ = open(lock_path.c_str(), O_CREAT | O_RDWR, 0644);
    if (fd_ < 0) return;
    if (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        close(fd_);
        fd_ = -1;
        return;
    }

    // Holder's pid, read back by holder_pid() in a second instance
    std::string pid = std::to_string(getpid()) + "\n";
    if (ftruncate(fd_, 0) != 0 ||
        write(fd_, pid.data(), pid.size()) != static_cast<ssize_t>(pid.size())) {
        log_warn("Could not record pid in " + lock_path);
    }
#endif
}

std::optional<int> SingletonLock::holder_pid() const {
    std::ifstream in(path_);
    if (!in) return std::nullopt;
    std::stringstream ss;
    ss << in.rdbuf();
    int pid = safe_stoi(trimmed(ss.str()), -1);
    if (pid <= 0) return std::nullopt;
    return pid;
}

SingletonLock::~SingletonLock() {
    if (fd_ < 0) return;
#ifdef _WIN32
    _close(fd_);
#else
    close(fd_);
#endif
    // flock is released automatically when fd is closed
}
