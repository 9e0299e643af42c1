#include "transport.hpp"

#include "errors.hpp"
#include "json_codec.hpp"
#include "logger.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <log4cplus/loggingmacros.h>

namespace bridge {

namespace {

std::string errno_text(int err) {
    return std::strerror(err);
}

void set_socket_timeout(int fd, int option, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (::setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) < 0) {
        throw ConnectionError("Failed to set socket timeout: " + errno_text(errno));
    }
}

void set_blocking(int fd, bool blocking) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        throw ConnectionError("fcntl(F_GETFL) failed: " + errno_text(errno));
    }
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    if (::fcntl(fd, F_SETFL, flags) < 0) {
        throw ConnectionError("fcntl(F_SETFL) failed: " + errno_text(errno));
    }
}

void connect_with_timeout(int fd, const addrinfo* addr, std::chrono::milliseconds timeout) {
    set_blocking(fd, false);

    if (::connect(fd, addr->ai_addr, addr->ai_addrlen) < 0) {
        if (errno != EINPROGRESS) {
            throw ConnectionError("connect failed: " + errno_text(errno));
        }

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        int ready = 0;
        do {
            ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        } while (ready < 0 && errno == EINTR);

        if (ready == 0) {
            throw ConnectionError("Connection timeout");
        }
        if (ready < 0) {
            throw ConnectionError("poll failed during connect: " + errno_text(errno));
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            throw ConnectionError("getsockopt(SO_ERROR) failed: " + errno_text(errno));
        }
        if (so_error != 0) {
            throw ConnectionError("connect failed: " + errno_text(so_error));
        }
    }

    set_blocking(fd, true);
}

} // namespace

SocketTransport::SocketTransport(int fd) : fd_(fd) {}

SocketTransport::~SocketTransport() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void SocketTransport::write_message(const std::string& frame) {
    if (fd_ < 0) {
        throw ConnectionError("Socket is not open");
    }

    std::size_t total_sent = 0;
    while (total_sent < frame.size()) {
        const std::size_t chunk = std::min(kWriteChunkSize, frame.size() - total_sent);
        ssize_t sent = ::send(fd_, frame.data() + total_sent, chunk, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw ConnectionError("Socket write timeout");
            }
            throw ConnectionError("Error writing to socket: " + errno_text(errno));
        }
        if (sent == 0) {
            throw ConnectionError("Socket connection broken during write");
        }
        total_sent += static_cast<std::size_t>(sent);
        LOG4CPLUS_TRACE(transport_logger(), "Sent " << total_sent << "/" << frame.size() << " bytes");
    }
}

void SocketTransport::read_exact(char* out, std::size_t length, const char* what) {
    std::size_t offset = 0;
    while (offset < length) {
        ssize_t chunk = ::recv(fd_, out + offset, length - offset, 0);
        if (chunk < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw ConnectionError(std::string("Socket read timeout while reading ") + what);
            }
            throw ConnectionError("Error reading from socket: " + errno_text(errno));
        }
        if (chunk == 0) {
            throw ConnectionError(std::string("Socket closed by peer while reading ") + what + " (read " +
                                  std::to_string(offset) + "/" + std::to_string(length) + " bytes)");
        }
        offset += static_cast<std::size_t>(chunk);
    }
}

std::string SocketTransport::read_message() {
    if (fd_ < 0) {
        throw ConnectionError("Socket is not open");
    }

    std::string frame(kLengthPrefixSize, '\0');
    read_exact(frame.data(), kLengthPrefixSize, "length prefix");

    const uint32_t length = codec::read_length_prefix(frame.data());
    if (length == 0 || length > kMaxMessageSize) {
        throw ConnectionError("Invalid message length: " + std::to_string(length));
    }

    frame.resize(kLengthPrefixSize + length);
    read_exact(frame.data() + kLengthPrefixSize, length, "message body");
    LOG4CPLUS_TRACE(transport_logger(), "Read complete message: " << frame.size() << " bytes");
    return frame;
}

void SocketTransport::set_send_timeout(std::chrono::milliseconds timeout) {
    if (fd_ < 0) {
        return;
    }
    set_socket_timeout(fd_, SO_SNDTIMEO, timeout);
    send_timeout_ = timeout;
}

void SocketTransport::set_read_timeout(std::chrono::milliseconds timeout) {
    if (fd_ < 0) {
        return;
    }
    set_socket_timeout(fd_, SO_RCVTIMEO, timeout);
}

void SocketTransport::close() {
    if (fd_ < 0) {
        return;
    }
    const int fd = fd_;
    fd_ = -1;
    ::shutdown(fd, SHUT_RDWR);
    if (::close(fd) < 0) {
        throw ConnectionError("Error closing socket: " + errno_text(errno));
    }
}

std::unique_ptr<SocketTransport> connect_tcp(const TcpEndpoint& endpoint) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    const std::string port = std::to_string(endpoint.port);
    int rc = ::getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &results);
    if (rc != 0) {
        throw ConnectionError("Failed to resolve " + endpoint.host + ": " + ::gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(results, &::freeaddrinfo);

    std::string last_error = "no addresses";
    for (const addrinfo* addr = results; addr; addr = addr->ai_next) {
        int fd = ::socket(addr->ai_family, addr->ai_socktype | SOCK_CLOEXEC, addr->ai_protocol);
        if (fd < 0) {
            last_error = "socket: " + errno_text(errno);
            continue;
        }

        auto transport = std::make_unique<SocketTransport>(fd);
        try {
            connect_with_timeout(fd, addr, endpoint.connect_timeout);

            int one = 1;
            if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) < 0) {
                throw ConnectionError("Failed to set TCP_NODELAY: " + errno_text(errno));
            }
            transport->set_read_timeout(endpoint.read_timeout);
            transport->set_send_timeout(endpoint.read_timeout);
            return transport;
        } catch (const ConnectionError& exc) {
            last_error = exc.what();
            LOG4CPLUS_DEBUG(transport_logger(), "Connect attempt to " << endpoint.host << ":" << endpoint.port
                                                                      << " failed: " << last_error);
        }
    }

    throw ConnectionError("Failed to connect to " + endpoint.host + ":" + port + ": " + last_error);
}

TransportFactory make_tcp_transport_factory(TcpEndpoint endpoint) {
    return [endpoint]() -> std::unique_ptr<Transport> {
        return connect_tcp(endpoint);
    };
}

} // namespace bridge
