#include "utils.hpp"

#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace {
auto bindLoopback(int fd) -> std::uint16_t
{
    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port        = 0;

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw std::runtime_error("bind() failed: " + std::string(strerror(errno)));
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        throw std::runtime_error("getsockname() failed: " + std::string(strerror(errno)));
    }
    return ntohs(addr.sin_port);
}
} // namespace

LoopbackListener::LoopbackListener()
{
    fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::runtime_error("socket() failed: " + std::string(strerror(errno)));
    }

    try {
        boundPort = bindLoopback(fd);
    } catch (...) {
        close();
        throw;
    }

    // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    if (::listen(fd, 16) < 0) {
        close();
        throw std::runtime_error("listen() failed: " + std::string(strerror(errno)));
    }
}

LoopbackListener::~LoopbackListener()
{
    close();
}

void LoopbackListener::close()
{
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

auto unusedLoopbackPort() -> std::uint16_t
{
    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::runtime_error("socket() failed: " + std::string(strerror(errno)));
    }

    try {
        const auto port = bindLoopback(fd);
        ::close(fd);
        return port;
    } catch (...) {
        ::close(fd);
        throw;
    }
}

FakeProcess::FakeProcess(std::shared_ptr<ProcessSpy> spy, pid_t pid)
    : spy(std::move(spy)), fakePid(pid)
{
    this->spy->liveHandles++;
}

FakeProcess::~FakeProcess()
{
    spy->liveHandles--;
}

auto FakeProcess::terminate() -> bool
{
    spy->terminations++;
    if (terminated.exchange(true)) {
        spy->repeatedTerminations++;
    }
    if (spy->throwOnTerminate) {
        // NOLINTNEXTLINE(hicpp-exception-baseclass)
        throw 7;
    }
    if (spy->failTerminate) {
        return false;
    }
    spy->alive = false;
    return true;
}

auto FakeProcess::is_alive() -> bool
{
    return spy->alive && !terminated;
}

auto makeFakeLauncher(const std::shared_ptr<ProcessSpy>& spy) -> Launcher
{
    return [spy](const LaunchCommand&) -> std::unique_ptr<ProcessHandle> {
        const auto count = ++spy->launches;
        if (spy->failLaunch) {
            return nullptr;
        }
        spy->alive = true;
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
        return std::make_unique<FakeProcess>(spy, 10000 + count);
    };
}
