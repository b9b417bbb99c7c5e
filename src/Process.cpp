#include "Process.hpp"
#include "Common.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace
{

[[nodiscard]] auto describe_status(const int status) -> std::string
{
    if (WIFEXITED(status)) {
        return "exit code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "signal " + std::to_string(WTERMSIG(status));
    }
    return "status " + std::to_string(status);
}

void close_fd(int &fd)
{
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

auto ChildProcess::spawn(const LaunchCommand &command)
  -> std::unique_ptr<ChildProcess>
{
    // argv is built before fork(), the child only makes async-signal-safe
    // calls before exec.
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(command.program.c_str()));
    for (const auto &arg : command.args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // The child writes its errno here if exec fails. On a successful exec
    // O_CLOEXEC closes the write end and the parent reads EOF.
    int status_pipe[2];
    if (pipe2(static_cast<int *>(status_pipe), O_CLOEXEC) < 0) {
        log_error("[Process] failed to create status pipe: ", strerror(errno));
        return nullptr;
    }
    int read_fd  = status_pipe[0];
    int write_fd = status_pipe[1];

    const pid_t pid = fork();
    if (pid < 0) {
        log_error("[Process] fork failed: ", strerror(errno));
        close_fd(read_fd);
        close_fd(write_fd);
        return nullptr;
    }

    if (pid == 0) {
        ::close(read_fd);
        ::setpgid(0, 0);
        ::execvp(argv[0], argv.data());

        const int exec_errno = errno;
        if (::write(write_fd, &exec_errno, sizeof(exec_errno)) < 0) {
            _exit(126);
        }
        _exit(127);
    }

    close_fd(write_fd);

    // Also done from the parent so the group exists before we might signal
    // it. EACCES means the child already exec'd and set it itself.
    if (::setpgid(pid, pid) < 0 && errno != EACCES) {
        log_debug("[Process] setpgid(", pid, ") failed: ", strerror(errno));
    }

    int     exec_errno = 0;
    ssize_t bytes      = 0;
    do {
        bytes = ::read(read_fd, &exec_errno, sizeof(exec_errno));
    } while (bytes < 0 && errno == EINTR);
    close_fd(read_fd);

    if (bytes > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        log_error(
          "[Process] failed to exec \"", command.program,
          "\": ", strerror(exec_errno)
        );
        return nullptr;
    }

    return std::unique_ptr<ChildProcess>(new ChildProcess(pid));
}

ChildProcess::ChildProcess(pid_t pid)
  : child_pid{ pid }
{}

auto ChildProcess::terminate() -> bool
{
    if (reaped) { return true; }

    // Negative pid addresses the whole process group, which also takes
    // down anything the server forked.
    if (::kill(-child_pid, SIGKILL) < 0) {
        if (errno != ESRCH) {
            log_error(
              "[Process] failed to kill process group ", child_pid, ": ",
              strerror(errno)
            );
            return false;
        }

        if (::kill(child_pid, SIGKILL) < 0 && errno != ESRCH) {
            log_error(
              "[Process] failed to kill pid ", child_pid, ": ", strerror(errno)
            );
            return false;
        }
    }

    reap();
    return true;
}

auto ChildProcess::is_alive() -> bool
{
    if (reaped) { return false; }

    int         status = 0;
    const pid_t result = ::waitpid(child_pid, &status, WNOHANG);
    if (result == child_pid) {
        reaped = true;
        log_info(
          "[Process] pid ", child_pid, " exited with ", describe_status(status)
        );
        return false;
    }
    if (result < 0) {
        if (errno == ECHILD) { reaped = true; }
        return false;
    }

    return true;
}

void ChildProcess::reap()
{
    int   status = 0;
    pid_t result = 0;
    do {
        result = ::waitpid(child_pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    reaped = true;
    if (result == child_pid) {
        log_debug(
          "[Process] reaped pid ", child_pid, " (", describe_status(status), ")"
        );
    }
}

auto launch_child_process(const LaunchCommand &command)
  -> std::unique_ptr<ProcessHandle>
{
    return ChildProcess::spawn(command);
}
