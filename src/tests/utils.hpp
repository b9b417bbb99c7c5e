#ifndef AGENTDESK_TESTS_UTILS_HPP
#define AGENTDESK_TESTS_UTILS_HPP

#include <atomic>
#include <cstdint>
#include <memory>

#include "../Process.hpp"

/**
 * RAII TCP listener on 127.0.0.1 with a kernel-assigned port. Connections
 * complete through the backlog, nothing is ever accepted.
 */
class LoopbackListener
{
public:
    LoopbackListener();
    ~LoopbackListener();

    LoopbackListener(const LoopbackListener&)            = delete;
    LoopbackListener& operator=(const LoopbackListener&) = delete;

    [[nodiscard]] auto port() const -> std::uint16_t { return boundPort; }

    void close();

private:
    int           fd        = -1;
    std::uint16_t boundPort = 0;
};

// A loopback port that had no listener at the time of the call.
auto unusedLoopbackPort() -> std::uint16_t;

// Shared counters so tests can observe fake processes after the supervisor
// has dropped them.
struct ProcessSpy
{
    std::atomic<int>  launches{ 0 };
    std::atomic<int>  terminations{ 0 };
    std::atomic<int>  liveHandles{ 0 };
    std::atomic<int>  repeatedTerminations{ 0 };
    std::atomic<bool> failLaunch{ false };
    std::atomic<bool> failTerminate{ false };
    std::atomic<bool> throwOnTerminate{ false };
    std::atomic<bool> alive{ true };
};

class FakeProcess final : public ProcessHandle
{
public:
    FakeProcess(std::shared_ptr<ProcessSpy> spy, pid_t pid);
    ~FakeProcess() override;

    FakeProcess(const FakeProcess&)            = delete;
    FakeProcess& operator=(const FakeProcess&) = delete;

    [[nodiscard]] auto terminate() -> bool override;
    [[nodiscard]] auto is_alive() -> bool override;
    [[nodiscard]] auto pid() const -> pid_t override { return fakePid; }

private:
    std::shared_ptr<ProcessSpy> spy;
    pid_t                       fakePid;
    std::atomic<bool>           terminated{ false };
};

// Launcher that hands out FakeProcess handles and counts launches.
auto makeFakeLauncher(const std::shared_ptr<ProcessSpy>& spy) -> Launcher;

#endif // AGENTDESK_TESTS_UTILS_HPP
