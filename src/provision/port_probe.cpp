#include "provision/port_probe.hpp"
#include "common/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

struct SocketCloser {
    int fd = -1;
    ~SocketCloser() {
        if (fd >= 0) {
            ::close(fd);
        }
    }
};

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const { freeaddrinfo(info); }
};

bool connectWithin(const addrinfo* addr, int timeoutMs) {
    SocketCloser socketCloser;
    socketCloser.fd = ::socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
    if (socketCloser.fd < 0) {
        return false;
    }

    const int flags = fcntl(socketCloser.fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(socketCloser.fd, F_SETFL, flags | O_NONBLOCK);
    }

    if (::connect(socketCloser.fd, addr->ai_addr, addr->ai_addrlen) == 0) {
        return true;
    }
    if (errno != EINPROGRESS) {
        return false;
    }

    pollfd pfd{};
    pfd.fd = socketCloser.fd;
    pfd.events = POLLOUT;
    int rc;
    do {
        rc = ::poll(&pfd, 1, timeoutMs);
    } while (rc < 0 && errno == EINTR);
    if (rc <= 0) {
        return false;
    }

    int socketError = 0;
    socklen_t socketErrorLen = sizeof(socketError);
    return getsockopt(socketCloser.fd, SOL_SOCKET, SO_ERROR, &socketError, &socketErrorLen) == 0 &&
           socketError == 0;
}

}  // namespace

bool TcpPortProbe::isOpen(const std::string& host, int port, std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    const std::string portStr = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &result);
    if (rc != 0) {
        Logger::debug("Cannot resolve " + host + ": " + gai_strerror(rc));
        return false;
    }
    std::unique_ptr<addrinfo, AddrInfoDeleter> addresses(result);

    for (const addrinfo* addr = addresses.get(); addr != nullptr; addr = addr->ai_next) {
        if (connectWithin(addr, static_cast<int>(timeout.count()))) {
            return true;
        }
    }
    return false;
}
