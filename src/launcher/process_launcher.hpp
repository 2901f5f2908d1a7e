#pragma once

#include <string>
#include <vector>
#include <sys/types.h>

struct LaunchResult {
    bool success = false;
    pid_t pid = -1;
    std::string message;
};

/// Starts the application as a child process. The launcher's only
/// contract with it: run the executable with the working directory set to
/// its version directory.
class ProcessLauncher {
public:
    ProcessLauncher() = default;
    ~ProcessLauncher() = default;

    /// fork + chdir + execv. Exec failures in the child (missing file,
    /// not executable, bad chdir) are reported back through a close-on-exec
    /// pipe, so success means the program image is really running.
    LaunchResult start(const std::string& binary_path,
                       const std::string& working_dir,
                       const std::vector<std::string>& args = {});

    /// Block until the child exits; returns its exit code (-1 if killed
    /// by a signal or not our child)
    int wait_for_exit();

    /// Get the PID of the child process (-1 if not running)
    pid_t child_pid() const { return child_pid_; }

private:
    pid_t child_pid_ = -1;
};
