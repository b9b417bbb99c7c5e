#include "Supervisor.hpp"
#include "Common.hpp"
#include "LivenessProbe.hpp"

#include <exception>
#include <utility>

auto to_string(const Supervisor::State state) -> std::string_view
{
    switch (state) {
    case Supervisor::State::Idle: return "Idle";
    case Supervisor::State::Starting: return "Starting";
    case Supervisor::State::Running: return "Running";
    case Supervisor::State::ShuttingDown: return "ShuttingDown";
    case Supervisor::State::Stopped: return "Stopped";
    }
    return "Unknown";
}

Supervisor::Supervisor(
  Endpoint      endpoint,
  LaunchCommand command,
  Launcher      launcher
)
  : endpoint{ std::move(endpoint) }
  , command{ std::move(command) }
  , launcher{ std::move(launcher) }
{}

Supervisor::~Supervisor() { shutdown(); }

void Supervisor::ensure_started()
{
    const std::lock_guard<std::mutex> lock(mutex);

    if (process) {
        log_info(
          "[Supervisor] server already owned (pid ", process->pid(), ")"
        );
        return;
    }

    if (probe(endpoint)) {
        log_info(
          "[Supervisor] server already listening on ", endpoint.to_string(),
          ", not launching"
        );
        return;
    }
    log_info(
      "[Supervisor] nothing listening on ", endpoint.to_string(),
      ", launching server"
    );

    transition(State::Starting);
    log_info("[Supervisor] spawning \"", command.to_string(), "\"");

    auto spawned = launch();
    if (!spawned) {
        log_error(
          "[Supervisor] failed to launch \"", command.to_string(),
          "\", continuing without a local server"
        );
        transition(State::Idle);
        return;
    }

    log_info("[Supervisor] server started (pid ", spawned->pid(), ")");
    process = std::move(spawned);
    transition(State::Running);
}

void Supervisor::shutdown()
{
    const std::lock_guard<std::mutex> lock(mutex);

    if (!process) {
        log_debug("[Supervisor] shutdown: no server owned");
        return;
    }

    transition(State::ShuttingDown);
    const auto pid = process->pid();
    log_info("[Supervisor] terminating server (pid ", pid, ")");

    bool terminated = false;
    try {
        terminated = process->terminate();
    } catch (const std::exception &e) {
        log_error("[Supervisor] terminate threw: ", e.what());
    } catch (...) {
        log_error("[Supervisor] terminate threw an unknown exception");
    }

    if (terminated) {
        log_info("[Supervisor] server (pid ", pid, ") terminated");
    } else {
        log_error(
          "[Supervisor] failed to terminate server (pid ", pid,
          "), forgetting it anyway"
        );
    }

    // A handle that failed to terminate is not retried.
    process.reset();
    transition(State::Stopped);
    transition(State::Idle);
}

void Supervisor::transition(const State next)
{
    log_debug("[Supervisor] ", to_string(state), " -> ", to_string(next));
    state = next;
}

auto Supervisor::launch() -> std::unique_ptr<ProcessHandle>
{
    try {
        return launcher(command);
    } catch (const std::exception &e) {
        log_error("[Supervisor] launcher threw: ", e.what());
    } catch (...) {
        log_error("[Supervisor] launcher threw an unknown exception");
    }
    return nullptr;
}
