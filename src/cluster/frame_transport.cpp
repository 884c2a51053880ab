/**
 * @file frame_transport.cpp
 * @brief FramedSocket / FrameServer implementation with poll()-based timeouts.
 * @author BeaconMesh contributors
 */

#include "cluster/frame_transport.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace beacon_mesh {

namespace {

constexpr int POLL_SLICE_MS = 100;
constexpr uint32_t SEND_TIMEOUT_MS = 5000;
constexpr uint32_t SERVE_REQUEST_TIMEOUT_MS = 2000;

/**
 * @brief Set TCP_NODELAY and keepalive on a connected socket.
 */
void configure_socket(int fd) {
    int flag = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag));
}

void encode_u32(char* buf, uint32_t val) {
    buf[0] = static_cast<char>((val >> 24) & 0xFF);
    buf[1] = static_cast<char>((val >> 16) & 0xFF);
    buf[2] = static_cast<char>((val >> 8) & 0xFF);
    buf[3] = static_cast<char>(val & 0xFF);
}

uint32_t decode_u32(const char* buf) {
    const auto* p = reinterpret_cast<const uint8_t*>(buf);
    return (static_cast<uint32_t>(p[0]) << 24)
         | (static_cast<uint32_t>(p[1]) << 16)
         | (static_cast<uint32_t>(p[2]) << 8)
         | static_cast<uint32_t>(p[3]);
}

std::string errno_text(int err) {
    return std::string(std::strerror(err));
}

std::string address_of(const sockaddr_in& addr) {
    char ip_buf[INET_ADDRSTRLEN] = {};
    ::inet_ntop(AF_INET, &addr.sin_addr, ip_buf, sizeof(ip_buf));
    return std::string(ip_buf) + ":" + std::to_string(ntohs(addr.sin_port));
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// FramedSocket
// ─────────────────────────────────────────────

FramedSocket::FramedSocket(int fd, std::string peer_address, uint32_t max_frame_size)
    : fd_(fd)
    , peer_address_(std::move(peer_address))
    , max_frame_size_(max_frame_size) {}

FramedSocket::~FramedSocket() {
    shutdown();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Result<std::unique_ptr<FramedSocket>> FramedSocket::connect(const std::string& address,
                                                            uint16_t port,
                                                            uint32_t timeout_ms,
                                                            uint32_t max_frame_size,
                                                            std::stop_token stop) {
    sockaddr_in server{};
    server.sin_family = AF_INET;
    server.sin_port = htons(port);
    if (::inet_pton(AF_INET, address.c_str(), &server.sin_addr) != 1) {
        return make_error<std::unique_ptr<FramedSocket>>(
            ErrorKind::NetworkTransient, "Invalid address: " + address);
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0);
    if (fd < 0) {
        return make_error<std::unique_ptr<FramedSocket>>(
            ErrorKind::NetworkTransient, "Failed to create socket: " + errno_text(errno));
    }

    auto fail = [fd](std::string message) {
        ::close(fd);
        return make_error<std::unique_ptr<FramedSocket>>(ErrorKind::NetworkTransient,
                                                         std::move(message));
    };

    int ret = ::connect(fd, reinterpret_cast<const sockaddr*>(&server), sizeof(server));
    if (ret < 0 && errno != EINPROGRESS) {
        return fail("Connect to " + address + ":" + std::to_string(port)
                    + " failed: " + errno_text(errno));
    }

    if (ret < 0) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (true) {
            if (stop.stop_requested()) {
                return fail("Connect cancelled");
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                return fail("Connect to " + address + ":" + std::to_string(port) + " timed out");
            }

            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            int ready = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining, POLL_SLICE_MS)));
            if (ready < 0 && errno != EINTR) {
                return fail("Connect poll failed: " + errno_text(errno));
            }
            if (ready > 0) break;
        }

        int err = 0;
        socklen_t len = sizeof(err);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len);
        if (err != 0) {
            return fail("Connect to " + address + ":" + std::to_string(port)
                        + " failed: " + errno_text(err));
        }
    }

    configure_socket(fd);
    return std::make_unique<FramedSocket>(fd, address + ":" + std::to_string(port),
                                          max_frame_size);
}

Result<void> FramedSocket::send_frame(std::string_view payload) {
    if (payload.size() > max_frame_size_) {
        return Error{ErrorKind::ProtocolViolation,
                     "Frame too large: " + std::to_string(payload.size()) + " bytes"};
    }
    if (!open_.load()) {
        return Error{ErrorKind::NetworkTransient, "Socket is closed"};
    }

    std::string frame(4, '\0');
    encode_u32(frame.data(), static_cast<uint32_t>(payload.size()));
    frame.append(payload);

    std::lock_guard lock(send_mutex_);
    const char* ptr = frame.data();
    size_t remaining = frame.size();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(SEND_TIMEOUT_MS);

    while (remaining > 0) {
        if (!open_.load()) {
            return Error{ErrorKind::NetworkTransient, "Socket closed during send"};
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return Error{ErrorKind::NetworkTransient, "Send timed out"};
        }

        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLOUT;
        int ready = ::poll(&pfd, 1, POLL_SLICE_MS);
        if (ready < 0 && errno != EINTR) {
            return Error{ErrorKind::NetworkTransient, "Send poll failed: " + errno_text(errno)};
        }
        if (ready <= 0) continue;

        auto sent = ::send(fd_, ptr, remaining, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return Error{ErrorKind::NetworkTransient, "Send failed: " + errno_text(errno)};
        }

        ptr += sent;
        remaining -= static_cast<size_t>(sent);
    }

    return Result<void>{};
}

std::optional<std::string> FramedSocket::take_buffered_frame() {
    if (read_buffer_.size() < 4) return std::nullopt;
    uint32_t length = decode_u32(read_buffer_.data());
    if (read_buffer_.size() < 4 + static_cast<size_t>(length)) return std::nullopt;

    std::string payload = read_buffer_.substr(4, length);
    read_buffer_.erase(0, 4 + static_cast<size_t>(length));
    return payload;
}

Result<std::optional<std::string>> FramedSocket::receive_frame(uint32_t timeout_ms) {
    using FrameResult = Result<std::optional<std::string>>;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    char chunk[4096];

    while (true) {
        if (read_buffer_.size() >= 4 && decode_u32(read_buffer_.data()) > max_frame_size_) {
            open_.store(false);
            return FrameResult(Error{ErrorKind::ProtocolViolation,
                "Frame too large: " + std::to_string(decode_u32(read_buffer_.data())) + " bytes"});
        }
        if (auto frame = take_buffered_frame()) {
            return FrameResult(std::optional<std::string>(std::move(*frame)));
        }
        if (!open_.load()) {
            return FrameResult(Error{ErrorKind::NetworkTransient, "Socket is closed"});
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            return FrameResult(std::optional<std::string>{});
        }

        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining, POLL_SLICE_MS)));
        if (ready < 0 && errno != EINTR) {
            open_.store(false);
            return FrameResult(Error{ErrorKind::NetworkTransient,
                                     "Receive poll failed: " + errno_text(errno)});
        }
        if (ready <= 0) continue;

        auto received = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (received == 0) {
            open_.store(false);
            return FrameResult(Error{ErrorKind::NetworkTransient, "Connection closed by peer"});
        }
        if (received < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            open_.store(false);
            return FrameResult(Error{ErrorKind::NetworkTransient,
                                     "Receive failed: " + errno_text(errno)});
        }
        read_buffer_.append(chunk, static_cast<size_t>(received));
    }
}

void FramedSocket::shutdown() {
    if (open_.exchange(false) && fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

// ─────────────────────────────────────────────
// FrameServer
// ─────────────────────────────────────────────

FrameServer::FrameServer(uint32_t max_frame_size)
    : max_frame_size_(max_frame_size) {}

FrameServer::~FrameServer() {
    close();
}

Result<void> FrameServer::listen(const std::string& bind_address, uint16_t port, int backlog) {
    if (listen_fd_ >= 0) {
        return Error{ErrorKind::Internal, "Already listening"};
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) != 1) {
        return Error{ErrorKind::ConfigurationError, "Invalid bind address: " + bind_address};
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0);
    if (fd < 0) {
        return Error{ErrorKind::NetworkTransient,
                     "Failed to create server socket: " + errno_text(errno)};
    }

    int optval = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        return Error{err == EADDRINUSE ? ErrorKind::ResourceConflict : ErrorKind::NetworkTransient,
                     "Bind to port " + std::to_string(port) + " failed: " + errno_text(err)};
    }

    if (::listen(fd, backlog) < 0) {
        int err = errno;
        ::close(fd);
        return Error{ErrorKind::NetworkTransient, "Listen failed: " + errno_text(err)};
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len);
    bound_port_ = ntohs(bound.sin_port);
    listen_fd_ = fd;
    return Result<void>{};
}

Result<std::unique_ptr<FramedSocket>> FrameServer::accept(uint32_t timeout_ms) {
    using AcceptResult = Result<std::unique_ptr<FramedSocket>>;
    if (listen_fd_ < 0) {
        return AcceptResult(Error{ErrorKind::NetworkTransient, "Not listening"});
    }

    pollfd pfd{};
    pfd.fd = listen_fd_;
    pfd.events = POLLIN;
    int ready = ::poll(&pfd, 1, static_cast<int>(std::min<uint32_t>(timeout_ms, POLL_SLICE_MS)));
    if (ready <= 0) {
        return AcceptResult(std::unique_ptr<FramedSocket>{});
    }

    sockaddr_in client_addr{};
    socklen_t addr_len = sizeof(client_addr);
    int client_fd = ::accept4(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr),
                              &addr_len, SOCK_NONBLOCK);
    if (client_fd < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR || errno == ECONNABORTED) {
            return AcceptResult(std::unique_ptr<FramedSocket>{});
        }
        return AcceptResult(Error{ErrorKind::NetworkTransient, "Accept failed: " + errno_text(errno)});
    }

    configure_socket(client_fd);
    return AcceptResult(std::make_unique<FramedSocket>(client_fd, address_of(client_addr),
                                                       max_frame_size_));
}

void FrameServer::serve(RequestHandler handler) {
    if (listen_fd_ < 0) return;

    serve_thread_ = std::jthread([this, handler = std::move(handler)](std::stop_token stop) {
        while (!stop.stop_requested()) {
            auto accepted = accept(POLL_SLICE_MS);
            if (!accepted || !accepted.value()) continue;

            auto& conn = accepted.value();
            auto deadline = std::chrono::steady_clock::now()
                          + std::chrono::milliseconds(SERVE_REQUEST_TIMEOUT_MS);
            while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
                auto request = conn->receive_frame(POLL_SLICE_MS);
                if (!request) break;
                if (!request.value()) continue;

                auto response = handler(*request.value());
                auto sent = conn->send_frame(response);
                (void)sent;  // Reply is best effort
                break;
            }
        }
    });
}

void FrameServer::stop_serving() {
    if (serve_thread_.joinable()) {
        serve_thread_.request_stop();
        serve_thread_.join();
    }
}

void FrameServer::close() {
    stop_serving();
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
}

// ─────────────────────────────────────────────
// Client helper
// ─────────────────────────────────────────────

Result<std::string> request_reply(const std::string& address, uint16_t port,
                                  std::string_view request, uint32_t timeout_ms) {
    auto conn = FramedSocket::connect(address, port, timeout_ms);
    if (!conn) return conn.error();

    auto sent = conn.value()->send_frame(request);
    if (!sent) return sent.error();

    auto reply = conn.value()->receive_frame(timeout_ms);
    if (!reply) return reply.error();
    if (!reply.value()) {
        return make_error<std::string>(ErrorKind::NetworkTransient,
                                       "No reply from " + address + ":" + std::to_string(port));
    }
    return std::move(*reply.value());
}

}  // namespace beacon_mesh
