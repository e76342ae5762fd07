#include "rtmpwire/core/transport/tcp/socket_stream.hpp"

#include <cerrno>
#include <cstring>

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include "lcr/log/logger.hpp"


namespace rtmpwire::core::transport::tcp {

SocketStream::~SocketStream() {
    close();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Error SocketStream::connect(const std::string& host, const std::string& port) noexcept {
    if (fd_ >= 0) {
        RW_WARN("[TCP] connect() called on an open socket");
        return Error::InvalidState;
    }
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    const int rc = ::getaddrinfo(host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0) {
        RW_ERROR("[TCP] Cannot resolve " << host << ":" << port << " (" << ::gai_strerror(rc) << ")");
        return Error::ConnectionFailed;
    }
    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            const int one = 1;
            (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
            fd_ = fd;
            break;
        }
        RW_DEBUG("[TCP] connect attempt failed: " << std::strerror(errno));
        ::close(fd);
    }
    ::freeaddrinfo(result);
    if (fd_ < 0) {
        RW_ERROR("[TCP] Cannot connect to " << host << ":" << port);
        return Error::ConnectionFailed;
    }
    closed_.store(false, std::memory_order_release);
    RW_INFO("[TCP] Connected to " << host << ":" << port);
    return Error::None;
}

std::ptrdiff_t SocketStream::read(char* buf, std::size_t n) noexcept {
    if (fd_ < 0) {
        return -1;
    }
    while (true) {
        const ssize_t r = ::recv(fd_, buf, n, 0);
        if (r >= 0) {
            return static_cast<std::ptrdiff_t>(r);
        }
        if (errno == EINTR) {
            continue;
        }
        if (!closed_.load(std::memory_order_acquire)) {
            RW_DEBUG("[TCP] recv failed: " << std::strerror(errno));
        }
        return -1;
    }
}

std::ptrdiff_t SocketStream::write(const char* buf, std::size_t n) noexcept {
    if (fd_ < 0) {
        return -1;
    }
    while (true) {
        const ssize_t w = ::send(fd_, buf, n, MSG_NOSIGNAL);
        if (w >= 0) {
            return static_cast<std::ptrdiff_t>(w);
        }
        if (errno == EINTR) {
            continue;
        }
        if (!closed_.load(std::memory_order_acquire)) {
            RW_DEBUG("[TCP] send failed: " << std::strerror(errno));
        }
        return -1;
    }
}

void SocketStream::close() noexcept {
    if (fd_ < 0 || closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    ::shutdown(fd_, SHUT_RDWR);
    RW_DEBUG("[TCP] Socket shut down");
}

} // namespace rtmpwire::core::transport::tcp
