#include "test_helpers.hpp"

#include "errors.hpp"
#include "json_codec.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <stdexcept>

namespace bridge::testing {

json frame_json(const std::string& frame) {
    if (frame.size() < kLengthPrefixSize) {
        throw std::invalid_argument("frame shorter than its length prefix");
    }
    const uint32_t length = codec::read_length_prefix(frame.data());
    return json::parse(frame.substr(kLengthPrefixSize, length));
}

std::string response_frame(int64_t id, const json& result, const json& error) {
    json message = {
        {"id", id},
        {"result", result},
        {"error", error},
    };
    return codec::frame_payload(message.dump());
}

std::string server_heartbeat_frame(int64_t id) {
    return response_frame(id, {{"type", kServerHeartbeatType}, {"timestamp", "2026-10-19T00:00:00Z"}});
}

std::vector<std::string> echo_responder(const json& request) {
    return {response_frame(request.at("id").get<int64_t>(), {{"echo", request.at("method")}})};
}

ScriptedTransport::ScriptedTransport(std::shared_ptr<ScriptedState> state) : state_(std::move(state)) {}

void ScriptedTransport::write_message(const std::string& frame) {
    json message = frame_json(frame);
    const bool is_request = message.contains("method");
    if (is_request) {
        ++state_->request_writes;
    }

    if (state_->on_write) {
        state_->on_write(message);
    }

    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->writes.push_back(frame);
    state_->events.push_back({std::this_thread::get_id(),
                              is_request ? ScriptedState::Op::WriteRequest : ScriptedState::Op::WriteAck,
                              message.at("id").get<int64_t>()});
    if (is_request && state_->responder) {
        for (auto& reply : state_->responder(message)) {
            state_->inbound.push_back(std::move(reply));
        }
    }
}

std::string ScriptedTransport::read_message() {
    if (state_->read_delay.count() > 0) {
        std::this_thread::sleep_for(state_->read_delay);
    }

    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->inbound.empty()) {
        throw ConnectionError("Socket closed by peer while reading length prefix (read 0/4 bytes)");
    }
    std::string frame = std::move(state_->inbound.front());
    state_->inbound.pop_front();

    int64_t id = -1;
    try {
        id = codec::as_int64(frame_json(frame).value("id", json(-1)), -1);
    } catch (const std::exception&) {
        // scripted garbage is allowed, it only has no id to record
    }
    state_->events.push_back({std::this_thread::get_id(), ScriptedState::Op::Read, id});
    return frame;
}

void ScriptedTransport::set_send_timeout(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->send_timeouts.push_back(timeout);
    send_timeout_ = timeout;
}

void ScriptedTransport::close() {
    ++state_->closes;
}

TransportFactory make_scripted_factory(std::shared_ptr<ScriptedState> state) {
    return [state]() -> std::unique_ptr<Transport> {
        int failing = state->failing_connects.load();
        if (failing != 0) {
            if (failing > 0) {
                --state->failing_connects;
            }
            throw ConnectionError("Connection refused");
        }
        ++state->connects;
        return std::make_unique<ScriptedTransport>(state);
    };
}

FakeGameServer::FakeGameServer(Handler handler) : handler_(std::move(handler)) {}

FakeGameServer::~FakeGameServer() {
    stop();
}

bool FakeGameServer::start() {
    if (running_) {
        return true;
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        return false;
    }

    int one = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::listen(server_fd_, 8) < 0) {
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    port_ = ntohs(addr.sin_port);

    running_ = true;
    accept_thread_ = std::thread(&FakeGameServer::accept_loop, this);
    return true;
}

void FakeGameServer::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    drop_clients();

    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        threads.swap(client_threads_);
    }
    for (auto& t : threads) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void FakeGameServer::drop_clients() {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    for (int fd : client_fds_) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

std::vector<json> FakeGameServer::received() {
    std::lock_guard<std::mutex> lock(received_mutex_);
    return received_;
}

bool FakeGameServer::wait_for_messages(std::size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(received_mutex_);
    return received_cv_.wait_for(lock, timeout, [this, count] { return received_.size() >= count; });
}

void FakeGameServer::accept_loop() {
    while (running_) {
        pollfd pfd{};
        pfd.fd = server_fd_;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, 50);
        if (ready <= 0) {
            continue;
        }

        int client_fd = ::accept(server_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            continue;
        }

        ++accepted_;
        std::lock_guard<std::mutex> lock(clients_mutex_);
        client_fds_.push_back(client_fd);
        client_threads_.emplace_back(&FakeGameServer::serve_client, this, client_fd);
    }
}

void FakeGameServer::serve_client(int client_fd) {
    std::string payload;
    while (read_frame(client_fd, payload)) {
        json message;
        try {
            message = json::parse(payload);
        } catch (const json::parse_error&) {
            break;
        }

        {
            std::lock_guard<std::mutex> lock(received_mutex_);
            received_.push_back(message);
        }
        received_cv_.notify_all();

        if (message.contains("method") && handler_) {
            bool ok = true;
            for (const auto& frame : handler_(message)) {
                if (!send_frame(client_fd, frame)) {
                    ok = false;
                    break;
                }
            }
            if (!ok) {
                break;
            }
        }
    }

    std::lock_guard<std::mutex> lock(clients_mutex_);
    client_fds_.erase(std::remove(client_fds_.begin(), client_fds_.end(), client_fd), client_fds_.end());
    ::close(client_fd);
}

bool FakeGameServer::read_frame(int fd, std::string& payload) {
    char prefix[kLengthPrefixSize];
    std::size_t got = 0;
    while (got < kLengthPrefixSize) {
        ssize_t n = ::recv(fd, prefix + got, kLengthPrefixSize - got, 0);
        if (n <= 0) {
            return false;
        }
        got += static_cast<std::size_t>(n);
    }

    const uint32_t length = codec::read_length_prefix(prefix);
    if (length == 0 || length > kMaxMessageSize) {
        return false;
    }

    payload.assign(length, '\0');
    std::size_t offset = 0;
    while (offset < length) {
        ssize_t n = ::recv(fd, payload.data() + offset, length - offset, 0);
        if (n <= 0) {
            return false;
        }
        offset += static_cast<std::size_t>(n);
    }
    return true;
}

bool FakeGameServer::send_frame(int fd, const std::string& frame) {
    std::size_t sent = 0;
    while (sent < frame.size()) {
        ssize_t n = ::send(fd, frame.data() + sent, frame.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace bridge::testing
