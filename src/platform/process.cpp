#include "process.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <chrono>
#include <cerrno>

namespace platform {

// Reap with SIGTERM then SIGKILL (waits up to 2s for graceful exit)
static void kill_child(pid_t pid) {
    kill(pid, SIGTERM);
    for (int i = 0; i < 20; i++) {
        int status;
        if (waitpid(pid, &status, WNOHANG) == pid) return;
        usleep(100 * 1000);
    }
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
}

ProcessResult run_process(const std::string& program,
                          const std::vector<std::string>& args,
                          int timeout_ms) {
    ProcessResult result;

    int fds[2];
    if (pipe(fds) != 0) {
        result.output = "pipe() failed";
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(fds[0]);
        close(fds[1]);
        result.output = "fork() failed";
        return result;
    }

    if (pid == 0) {
        // Child process
        close(STDIN_FILENO);
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        close(fds[0]);
        close(fds[1]);

        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent: drain output until EOF or deadline
    close(fds[1]);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    char buf[4096];
    while (true) {
        int wait_ms = -1;
        if (timeout_ms >= 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(left);
        }

        struct pollfd pfd = {fds[0], POLLIN, 0};
        int rc = poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;  // deadline re-checked above

        ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n <= 0) break;
        result.output.append(buf, static_cast<size_t>(n));
    }
    close(fds[0]);

    if (result.timed_out) {
        kill_child(pid);
        return result;
    }

    int status = 0;
    waitpid(pid, &status, 0);
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

} // namespace platform
