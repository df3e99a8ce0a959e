#include "transport/socket.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace hostbridge::transport {

using core::errors::BridgeError;
using core::errors::ErrorKind;

namespace {

void set_nonblocking(const int fd, const bool enabled) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    const int next = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    static_cast<void>(fcntl(fd, F_SETFL, next));
}

std::string errno_text(const int err) {
    return std::string(std::strerror(err));
}

std::string endpoint(const std::string& host, const std::uint16_t port) {
    return host + ":" + std::to_string(port);
}

struct AddrInfoList {
    addrinfo* head = nullptr;
    ~AddrInfoList() {
        if (head != nullptr) {
            freeaddrinfo(head);
        }
    }
};

core::errors::Result<int> resolve(const std::string& host, const std::uint16_t port,
                                  const bool passive, AddrInfoList& out) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = passive ? AI_PASSIVE : 0;

    const std::string service = std::to_string(port);
    const int rc = getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(),
                               &hints, &out.head);
    if (rc != 0) {
        return BridgeError{passive ? ErrorKind::Internal : ErrorKind::Connectivity,
                           "Unable to resolve " + endpoint(host, port) + ": " +
                               gai_strerror(rc),
                           "resolve_failed"};
    }
    return rc;
}

}  // namespace

SocketHandle::~SocketHandle() {
    reset();
}

SocketHandle::SocketHandle(SocketHandle&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

SocketHandle& SocketHandle::operator=(SocketHandle&& other) noexcept {
    if (this != &other) {
        reset();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void SocketHandle::shutdown_both() {
    if (fd_ >= 0) {
        static_cast<void>(::shutdown(fd_, SHUT_RDWR));
    }
}

void SocketHandle::abort() {
    if (fd_ >= 0) {
        linger hard{1, 0};
        static_cast<void>(setsockopt(fd_, SOL_SOCKET, SO_LINGER, &hard, sizeof(hard)));
    }
    reset();
}

void SocketHandle::reset() {
    if (fd_ >= 0) {
        static_cast<void>(::close(fd_));
        fd_ = -1;
    }
}

core::errors::Result<SocketHandle> listen_tcp(const std::string& host,
                                              const std::uint16_t port,
                                              const int backlog) {
    AddrInfoList addresses;
    auto resolved = resolve(host, port, true, addresses);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }

    int last_errno = 0;
    for (addrinfo* ai = addresses.head; ai != nullptr; ai = ai->ai_next) {
        SocketHandle socket(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC,
                                     ai->ai_protocol));
        if (!socket.valid()) {
            last_errno = errno;
            continue;
        }

        const int reuse = 1;
        static_cast<void>(setsockopt(socket.fd(), SOL_SOCKET, SO_REUSEADDR, &reuse,
                                     sizeof(reuse)));

        if (::bind(socket.fd(), ai->ai_addr, ai->ai_addrlen) != 0) {
            last_errno = errno;
            continue;
        }
        if (::listen(socket.fd(), backlog) != 0) {
            last_errno = errno;
            continue;
        }
        return std::move(socket);
    }

    return BridgeError{ErrorKind::Internal,
                       "Unable to listen on " + endpoint(host, port) + ": " +
                           errno_text(last_errno),
                       "listen_failed", "Is another bridge already using the port?"};
}

core::errors::Result<std::uint16_t> bound_port(const SocketHandle& socket) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(socket.fd(), reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return BridgeError{ErrorKind::Internal,
                           "getsockname failed: " + errno_text(errno),
                           "getsockname_failed"};
    }
    if (addr.ss_family == AF_INET) {
        return static_cast<std::uint16_t>(
            ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port));
    }
    if (addr.ss_family == AF_INET6) {
        return static_cast<std::uint16_t>(
            ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port));
    }
    return BridgeError{ErrorKind::Internal, "Socket is not an inet socket.",
                       "getsockname_failed"};
}

core::errors::Result<SocketHandle> connect_tcp(const std::string& host,
                                               const std::uint16_t port,
                                               const std::uint32_t timeout_ms) {
    AddrInfoList addresses;
    auto resolved = resolve(host, port, false, addresses);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }

    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    int last_errno = ECONNREFUSED;
    bool timed_out = false;

    for (addrinfo* ai = addresses.head; ai != nullptr; ai = ai->ai_next) {
        SocketHandle socket(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC,
                                     ai->ai_protocol));
        if (!socket.valid()) {
            last_errno = errno;
            continue;
        }
        set_nonblocking(socket.fd(), true);

        if (::connect(socket.fd(), ai->ai_addr, ai->ai_addrlen) != 0) {
            if (errno != EINPROGRESS) {
                last_errno = errno;
                continue;
            }

            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                       deadline - std::chrono::steady_clock::now())
                                       .count();
            pollfd pfd{socket.fd(), POLLOUT, 0};
            const int rc = remaining > 0 ? poll(&pfd, 1, static_cast<int>(remaining)) : 0;
            if (rc == 0) {
                timed_out = true;
                continue;
            }
            if (rc < 0) {
                last_errno = errno;
                continue;
            }

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (getsockopt(socket.fd(), SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
                last_errno = errno;
                continue;
            }
            if (so_error != 0) {
                last_errno = so_error;
                continue;
            }
        }

        set_nonblocking(socket.fd(), false);
        const int nodelay = 1;
        static_cast<void>(setsockopt(socket.fd(), IPPROTO_TCP, TCP_NODELAY, &nodelay,
                                     sizeof(nodelay)));
        return std::move(socket);
    }

    if (timed_out) {
        return BridgeError{ErrorKind::Timeout,
                           "Timed out connecting to host bridge at " +
                               endpoint(host, port),
                           "connect_timeout"};
    }
    return BridgeError{ErrorKind::Connectivity,
                       "Unable to connect to host bridge at " + endpoint(host, port) +
                           ": " + errno_text(last_errno),
                       "connect_failed",
                       "Start the bridge inside the host application first."};
}

core::errors::Result<std::size_t> write_all(const int fd, const std::string& data) {
    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n =
            ::send(fd, data.data() + written, data.size() - written, MSG_NOSIGNAL);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return BridgeError{ErrorKind::Connectivity,
                           "Send failed: " + errno_text(n < 0 ? errno : EPIPE),
                           "send_failed"};
    }
    return written;
}

bool peer_closed(const int fd) {
    pollfd pfd{fd, POLLRDHUP, 0};
    const int rc = poll(&pfd, 1, 0);
    if (rc <= 0) {
        return false;
    }
    return (pfd.revents & (POLLRDHUP | POLLHUP | POLLERR | POLLNVAL)) != 0;
}

bool connection_broken(const int fd) {
    pollfd pfd{fd, 0, 0};
    const int rc = poll(&pfd, 1, 0);
    if (rc <= 0) {
        return false;
    }
    return (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) != 0;
}

LineReader::LineReader(const std::size_t max_line_bytes)
    : max_line_bytes_(max_line_bytes) {}

bool LineReader::has_buffered_line() const {
    return buffer_.find('\n') != std::string::npos;
}

ReadStatus LineReader::read_line(const int fd, std::string& line, const int timeout_ms) {
    const auto started = std::chrono::steady_clock::now();
    char chunk[8192];

    while (true) {
        const auto newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            if (newline > max_line_bytes_) {
                buffer_.clear();
                return ReadStatus::Overflow;
            }
            line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            return ReadStatus::Line;
        }
        if (buffer_.size() > max_line_bytes_) {
            buffer_.clear();
            return ReadStatus::Overflow;
        }

        int wait_ms = -1;
        if (timeout_ms >= 0) {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - started)
                                     .count();
            if (elapsed >= timeout_ms) {
                return ReadStatus::Timeout;
            }
            wait_ms = timeout_ms - static_cast<int>(elapsed);
        }

        pollfd pfd{fd, POLLIN, 0};
        const int rc = poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return ReadStatus::Error;
        }
        if (rc == 0) {
            return ReadStatus::Timeout;
        }

        const ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n > 0) {
            buffer_.append(chunk, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            return ReadStatus::Closed;
        }
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
            continue;
        }
        if (errno == ECONNRESET || errno == EPIPE) {
            return ReadStatus::Closed;
        }
        return ReadStatus::Error;
    }
}

}  // namespace hostbridge::transport
