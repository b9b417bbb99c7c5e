#ifndef AGENTDESK_PROCESS_HPP
#define AGENTDESK_PROCESS_HPP

#include <functional>
#include <memory>

#include <sys/types.h>

#include "Config.hpp"

/**
 * Owned handle to a process the supervisor started.
 *
 * Only the owner may terminate it. Implementations must tolerate
 * terminate() being called on a process that has already exited.
 */
class ProcessHandle
{
  public:
    virtual ~ProcessHandle() = default;

    // Forcefully stops the process. False if the signal could not be
    // delivered; the caller drops the handle either way.
    [[nodiscard]] virtual auto terminate() -> bool = 0;

    [[nodiscard]] virtual auto is_alive() -> bool = 0;

    [[nodiscard]] virtual auto pid() const -> pid_t = 0;
};

class [[nodiscard]] ChildProcess final : public ProcessHandle
{
  public:
    // fork + execvp in a new process group. nullptr if the fork fails or
    // the child could not exec the program.
    [[nodiscard]] static auto spawn(const LaunchCommand &command)
      -> std::unique_ptr<ChildProcess>;

    ~ChildProcess() override = default;

    ChildProcess(const ChildProcess &)            = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;

    [[nodiscard]] auto terminate() -> bool override;
    [[nodiscard]] auto is_alive() -> bool override;
    [[nodiscard]] auto pid() const -> pid_t override { return child_pid; }

  private:
    explicit ChildProcess(pid_t pid);

    void reap();

    pid_t child_pid = -1;
    bool  reaped    = false;
};

using Launcher =
  std::function<std::unique_ptr<ProcessHandle>(const LaunchCommand &)>;

// Default Launcher backed by ChildProcess::spawn.
[[nodiscard]] auto launch_child_process(const LaunchCommand &command)
  -> std::unique_ptr<ProcessHandle>;

#endif // AGENTDESK_PROCESS_HPP
