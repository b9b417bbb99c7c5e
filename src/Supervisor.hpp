#ifndef AGENTDESK_SUPERVISOR_HPP
#define AGENTDESK_SUPERVISOR_HPP

#include <memory>
#include <mutex>
#include <string_view>

#include "Config.hpp"
#include "Process.hpp"
#include "TestingMacros.hpp"

/**
 * Keeps at most one local server process alive for the lifetime of the
 * desktop client.
 *
 * ensure_started() launches the server unless this supervisor already
 * owns one or something is already listening on the endpoint.
 * shutdown() kills the owned server, if any, and forgets it. Both may be
 * called any number of times from any thread; they serialize on one
 * mutex held for the whole call.
 *
 * Failures are logged and never thrown. A server that is still binding
 * its port when probed can be launched a second time; that race is
 * accepted.
 */
class [[nodiscard]] Supervisor final
{
  public:
    enum class State
    {
        Idle,
        Starting,
        Running,
        ShuttingDown,
        Stopped,
    };

    Supervisor(
      Endpoint      endpoint,
      LaunchCommand command,
      Launcher      launcher = launch_child_process
    );

    // Best-effort teardown for exit paths that never reached shutdown().
    ~Supervisor();

    Supervisor(const Supervisor &)            = delete;
    Supervisor &operator=(const Supervisor &) = delete;
    Supervisor(Supervisor &&)                 = delete;
    Supervisor &operator=(Supervisor &&)      = delete;

    void ensure_started();
    void shutdown();

  private:
    void transition(State next);

    // Returns nullptr instead of letting a launcher exception escape.
    [[nodiscard]] auto launch() -> std::unique_ptr<ProcessHandle>;

    const Endpoint      endpoint;
    const LaunchCommand command;
    Launcher            launcher;

    std::mutex                     mutex;
    std::unique_ptr<ProcessHandle> process;
    State                          state = State::Idle;

    EXPOSE_PROPERTY_FOR_TESTING(process);
    EXPOSE_PROPERTY_FOR_TESTING_READONLY(state);
};

[[nodiscard]] auto to_string(Supervisor::State state) -> std::string_view;

#endif // AGENTDESK_SUPERVISOR_HPP
