#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace bridge {

/**
 * A connected, message-oriented duplex stream.
 *
 * Frames are exchanged whole: write_message() sends every byte of an already
 * framed message and read_message() returns exactly one frame, length prefix
 * included. Every failure is reported as ConnectionError.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual void write_message(const std::string& frame) = 0;
    virtual std::string read_message() = 0;

    /// Bound for subsequent writes; zero means the transport's default.
    virtual void set_send_timeout(std::chrono::milliseconds timeout) { (void)timeout; }
    virtual std::chrono::milliseconds send_timeout() const { return std::chrono::milliseconds(0); }

    virtual void close() = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;

struct TcpEndpoint {
    std::string host = "localhost";
    int port = 8765;
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds read_timeout{90000};
};

class SocketTransport : public Transport {
public:
    static constexpr std::size_t kWriteChunkSize = 64 * 1024;

    /// Takes ownership of a connected stream socket.
    explicit SocketTransport(int fd);
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    void write_message(const std::string& frame) override;
    std::string read_message() override;

    void set_send_timeout(std::chrono::milliseconds timeout) override;
    std::chrono::milliseconds send_timeout() const override { return send_timeout_; }
    void set_read_timeout(std::chrono::milliseconds timeout);

    void close() override;

    int fd() const { return fd_; }

private:
    void read_exact(char* out, std::size_t length, const char* what);

    int fd_ = -1;
    std::chrono::milliseconds send_timeout_{0};
};

/// Open a TCP connection with a bounded connect phase, TCP_NODELAY and the
/// steady-state read timeout applied.
std::unique_ptr<SocketTransport> connect_tcp(const TcpEndpoint& endpoint);

TransportFactory make_tcp_transport_factory(TcpEndpoint endpoint);

} // namespace bridge
