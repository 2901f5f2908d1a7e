#include "launcher/process_launcher.hpp"
#include "core/logger.hpp"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>

// Child side: report errno to the parent and exit without running atexit hooks
static void report_and_exit(int fd, const char* stage) {
    int err = errno;
    char buf[128];
    int n = snprintf(buf, sizeof(buf), "%s: %s", stage, strerror(err));
    if (n > 0) {
        ssize_t written = write(fd, buf, static_cast<size_t>(n));
        (void)written;
    }
    _exit(127);
}

LaunchResult ProcessLauncher::start(const std::string& binary_path,
                                    const std::string& working_dir,
                                    const std::vector<std::string>& args) {
    LaunchResult result;

    if (access(binary_path.c_str(), X_OK) != 0) {
        result.message = "not executable: " + binary_path + " (" + strerror(errno) + ")";
        return result;
    }

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) != 0) {
        result.message = std::string("pipe failed: ") + strerror(errno);
        return result;
    }

    // Build argv before forking
    std::vector<const char*> argv;
    argv.push_back(binary_path.c_str());
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.message = std::string("fork failed: ") + strerror(errno);
        close(pipefd[0]);
        close(pipefd[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        close(pipefd[0]);
        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            report_and_exit(pipefd[1], "chdir");
        }
        // Own process group, so the launcher's terminal signals do not
        // take the application down with it
        setpgid(0, 0);
        execv(binary_path.c_str(), const_cast<char* const*>(argv.data()));
        report_and_exit(pipefd[1], "exec");
    }

    // Parent process: EOF on the pipe means exec succeeded
    close(pipefd[1]);
    std::string child_error;
    char buf[128];
    while (true) {
        ssize_t n = read(pipefd[0], buf, sizeof(buf));
        if (n > 0) {
            child_error.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    close(pipefd[0]);

    if (!child_error.empty()) {
        int status;
        waitpid(pid, &status, 0);
        result.message = child_error;
        return result;
    }

    child_pid_ = pid;
    result.success = true;
    result.pid = pid;
    Logger::get()->info("Started {} (pid {}) in {}", binary_path, pid, working_dir);
    return result;
}

int ProcessLauncher::wait_for_exit() {
    if (child_pid_ <= 0) return -1;

    int status = 0;
    pid_t r;
    do {
        r = waitpid(child_pid_, &status, 0);
    } while (r < 0 && errno == EINTR);

    child_pid_ = -1;
    if (r < 0) return -1;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}
