#include "LivenessProbe.hpp"
#include "Common.hpp"

#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

auto probe(const Endpoint &endpoint) -> bool
{
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo  *res  = nullptr;
    const auto port = std::to_string(endpoint.port);
    if (const auto rc =
          getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &res);
        rc != 0) {
        log_debug(
          "[Probe] cannot resolve ", endpoint.to_string(), ": ",
          gai_strerror(rc)
        );
        return false;
    }

    bool reachable = false;
    for (addrinfo *it = res; it != nullptr && !reachable; it = it->ai_next) {
        const int fd =
          ::socket(it->ai_family, it->ai_socktype | SOCK_CLOEXEC, it->ai_protocol);
        if (fd < 0) { continue; }

        if (::connect(fd, it->ai_addr, it->ai_addrlen) == 0) {
            reachable = true;
        } else {
            log_debug(
              "[Probe] connect to ", endpoint.to_string(),
              " failed: ", strerror(errno)
            );
        }
        ::close(fd);
    }
    freeaddrinfo(res);

    return reachable;
}
