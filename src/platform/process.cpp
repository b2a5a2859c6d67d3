#include "process.hpp"

#ifdef _WIN32
#  include <windows.h>
#  include <sstream>
#else
#  include <unistd.h>
#  include <fcntl.h>
#  include <cerrno>
#  include <cstring>
#endif

namespace platform {

#ifdef _WIN32

Result<int> spawn_detached(const std::string& program,
                           const std::vector<std::string>& args) {
    // Build command line
    std::ostringstream cmdline;
    cmdline << "\"" << program << "\"";
    for (const auto& arg : args) {
        cmdline << " \"" << arg << "\"";
    }
    std::string cmd_str = cmdline.str();

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    if (!CreateProcessA(nullptr, cmd_str.data(), nullptr, nullptr, FALSE,
                        DETACHED_PROCESS | CREATE_NEW_PROCESS_GROUP,
                        nullptr, nullptr, &si, &pi)) {
        return Result<int>::Err(ErrorKind::Io, "CreateProcess failed for " + program);
    }

    int pid = static_cast<int>(pi.dwProcessId);
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
    return Result<int>::Ok(pid);
}

#else // Unix

Result<int> spawn_detached(const std::string& program,
                           const std::vector<std::string>& args) {
    pid_t pid = fork();
    if (pid < 0) {
        return Result<int>::Err(ErrorKind::Io,
            std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child process: new session, no controlling terminal
        setsid();

        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        }

        // Build argv array
        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execv(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    return Result<int>::Ok(static_cast<int>(pid));
}

#endif

} // namespace platform
