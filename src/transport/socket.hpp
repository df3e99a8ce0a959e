#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "core/errors/bridge_errors.hpp"

namespace hostbridge::transport {

// Owns one socket descriptor and closes it on destruction.
class SocketHandle {
public:
    SocketHandle() = default;
    explicit SocketHandle(int fd) : fd_(fd) {}
    ~SocketHandle();

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;
    SocketHandle(SocketHandle&& other) noexcept;
    SocketHandle& operator=(SocketHandle&& other) noexcept;

    int fd() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    // Wakes any thread blocked on this socket without closing the fd.
    void shutdown_both();
    void reset();
    // Closes with a reset instead of a FIN, so the peer sees a broken
    // connection rather than end of stream.
    void abort();

private:
    int fd_ = -1;
};

// Binds and listens. Port 0 asks the kernel for an ephemeral port.
core::errors::Result<SocketHandle> listen_tcp(const std::string& host,
                                              std::uint16_t port, int backlog = 16);

core::errors::Result<std::uint16_t> bound_port(const SocketHandle& socket);

// Connect with a bounded wait. Refused or unreachable is a ConnectivityError,
// running out of time is a TimeoutError.
core::errors::Result<SocketHandle> connect_tcp(const std::string& host,
                                               std::uint16_t port,
                                               std::uint32_t timeout_ms);

core::errors::Result<std::size_t> write_all(int fd, const std::string& data);

// Non-blocking check for hang-up or error on a connected socket. A peer
// that only shut down its sending side counts as closed.
bool peer_closed(int fd);

// Non-blocking check that nothing can be written back any more: reset,
// error, or both directions shut down. A half-closed peer is not broken.
bool connection_broken(int fd);

enum class ReadStatus {
    Line,
    Timeout,
    Closed,
    Overflow,
    Error
};

// Splits a byte stream into '\n'-terminated lines. Bytes after a returned
// line stay buffered for the next call.
class LineReader {
public:
    explicit LineReader(std::size_t max_line_bytes);

    // timeout_ms < 0 waits without bound. The terminating '\n' is stripped.
    ReadStatus read_line(int fd, std::string& line, int timeout_ms);

    bool has_buffered_line() const;
    std::size_t buffered_bytes() const { return buffer_.size(); }

private:
    std::string buffer_;
    std::size_t max_line_bytes_;
};

}  // namespace hostbridge::transport
