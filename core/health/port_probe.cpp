#include "port_probe.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstring>

namespace warden {
namespace health {

namespace {

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// Try one resolved address. Returns 0 on success, an errno value otherwise (ETIMEDOUT on timeout).
int try_connect(const addrinfo *ai, std::chrono::steady_clock::time_point deadline) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) {
        return errno;
    }

    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int err = 0;
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
        if (errno != EINPROGRESS) {
            err = errno;
        } else {
            while (true) {
                struct pollfd pfd;
                pfd.fd = fd;
                pfd.events = POLLOUT;
                pfd.revents = 0;
                int wait_ms = remaining_ms(deadline);
                if (wait_ms <= 0) {
                    err = ETIMEDOUT;
                    break;
                }
                int ready = poll(&pfd, 1, wait_ms);
                if (ready < 0 && errno == EINTR) {
                    continue;
                }
                if (ready < 0) {
                    err = errno;
                } else if (ready == 0) {
                    err = ETIMEDOUT;
                } else {
                    socklen_t len = sizeof(err);
                    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
                        err = errno;
                    }
                }
                break;
            }
        }
    }

    ::close(fd);
    return err;
}

}  // namespace

PortProbeResult TcpPortProbe::probe(const std::string &host, int port, int timeout_ms) {
    PortProbeResult result;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    // Numeric hosts resolve without touching the network
    sockaddr_in v4{};
    if (::inet_pton(AF_INET, host.c_str(), &v4.sin_addr) == 1) {
        hints.ai_flags = AI_NUMERICHOST;
    }

    addrinfo *addrs = nullptr;
    const std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &addrs);
    if (rc != 0 || addrs == nullptr) {
        result.detail = "cannot resolve " + host + ": " + gai_strerror(rc);
        return result;
    }

    int last_err = ECONNREFUSED;
    for (addrinfo *ai = addrs; ai != nullptr; ai = ai->ai_next) {
        if (remaining_ms(deadline) <= 0) {
            last_err = ETIMEDOUT;
            break;
        }
        last_err = try_connect(ai, deadline);
        if (last_err == 0) {
            break;
        }
    }
    ::freeaddrinfo(addrs);

    const std::string endpoint = host + ":" + service;
    if (last_err == 0) {
        result.reachable = true;
        result.detail = endpoint + " accepting connections";
    } else if (last_err == ETIMEDOUT) {
        result.timed_out = true;
        result.detail = endpoint + " timed out after " + std::to_string(timeout_ms) + "ms";
    } else {
        result.detail = endpoint + " " + std::strerror(last_err);
    }
    return result;
}

}  // namespace health
}  // namespace warden
