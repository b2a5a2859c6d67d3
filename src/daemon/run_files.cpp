#include "run_files.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fstream>
#include <sstream>

RunFiles::RunFiles(const fs::path& config_path) {
    fs::path dir = run_dir(config_path);
    pid_path_ = dir / PID_FILE_NAME;
    port_path_ = dir / PORT_FILE_NAME;
}

static Result<void> write_number(const fs::path& path, int value) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return Result<void>::Err(ErrorKind::Io, "Failed to write " + path.string());
    }
    out << value;
    out.flush();
    if (!out) {
        return Result<void>::Err(ErrorKind::Io, "Failed to write " + path.string());
    }
    return Result<void>::Ok();
}

static Result<int> read_number(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<int>::Err(ErrorKind::ControlPlane, "No run file at " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();
    std::string text = trimmed(ss.str());
    int value = safe_stoi(text, -1);
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos || value <= 0) {
        return Result<int>::Err(ErrorKind::ControlPlane,
            "Invalid content in " + path.string() + ": '" + text + "'");
    }
    return Result<int>::Ok(value);
}

Result<void> RunFiles::write(int pid, int port) const {
    // Port last: clients look for it first, the pid must already be there
    auto p = write_number(pid_path_, pid);
    if (p.is_err()) return p;
    return write_number(port_path_, port);
}

Result<int> RunFiles::read_pid() const {
    return read_number(pid_path_);
}

Result<int> RunFiles::read_port() const {
    return read_number(port_path_);
}

void RunFiles::remove() const {
    std::error_code ec;
    fs::remove(port_path_, ec);
    fs::remove(pid_path_, ec);
}

bool RunFiles::exist() const {
    std::error_code ec;
    return fs::exists(port_path_, ec) || fs::exists(pid_path_, ec);
}
