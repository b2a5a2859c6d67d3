#pragma once

#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// chanhub.pid / chanhub.port beside the configuration file. They exist
// exactly while a daemon listens on the control plane.
class RunFiles {
public:
    explicit RunFiles(const fs::path& config_path);

    const fs::path& pid_path() const { return pid_path_; }
    const fs::path& port_path() const { return port_path_; }

    Result<void> write(int pid, int port) const;

    Result<int> read_pid() const;
    Result<int> read_port() const;

    // Removes both; missing files are fine.
    void remove() const;

    bool exist() const;

private:
    fs::path pid_path_;
    fs::path port_path_;
};
