/**
 * @file frame_transport.hpp
 * @brief Length-prefixed TCP framing for cluster links and the control port.
 * @author BeaconMesh contributors
 *
 * Wire format per frame:
 *   [uint32_t big-endian length][UTF-8 JSON payload]
 *
 * All waits use poll() in slices of at most 100 ms so that owners holding
 * a std::stop_token observe cancellation promptly.
 */

#pragma once

#include "core/result.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

namespace beacon_mesh {

/**
 * @brief One connected TCP socket speaking length-prefixed frames.
 *
 * send_frame() may be called from any thread; receive_frame() is meant for
 * a single reader. shutdown() wakes a blocked reader; the descriptor itself
 * is closed by the destructor only.
 */
class FramedSocket {
public:
    static constexpr uint32_t DEFAULT_MAX_FRAME = 1024 * 1024;  // 1 MB

    FramedSocket(int fd, std::string peer_address, uint32_t max_frame_size = DEFAULT_MAX_FRAME);
    ~FramedSocket();

    // Non-copyable
    FramedSocket(const FramedSocket&) = delete;
    FramedSocket& operator=(const FramedSocket&) = delete;

    /**
     * @brief Dial address:port, giving up after timeout_ms or on stop.
     * @return NetworkTransient on failure.
     */
    static Result<std::unique_ptr<FramedSocket>> connect(const std::string& address,
                                                         uint16_t port,
                                                         uint32_t timeout_ms,
                                                         uint32_t max_frame_size = DEFAULT_MAX_FRAME,
                                                         std::stop_token stop = {});

    Result<void> send_frame(std::string_view payload);

    /**
     * @brief Wait up to timeout_ms for one complete frame.
     * @return The payload, nullopt on timeout, NetworkTransient when the
     *         connection is gone, ProtocolViolation for an oversized frame.
     */
    Result<std::optional<std::string>> receive_frame(uint32_t timeout_ms);

    void shutdown();

    [[nodiscard]] bool is_open() const noexcept { return open_.load(); }
    [[nodiscard]] const std::string& peer_address() const noexcept { return peer_address_; }

private:
    std::optional<std::string> take_buffered_frame();

    int fd_;
    std::string peer_address_;
    uint32_t max_frame_size_;
    std::atomic<bool> open_{true};
    std::mutex send_mutex_;
    std::string read_buffer_;
};

/**
 * @brief Listening TCP socket producing FramedSockets.
 *
 * Either drive accept() from your own loop, or call serve() to answer one
 * request frame per connection on a background thread.
 */
class FrameServer {
public:
    static constexpr int DEFAULT_BACKLOG = 16;

    explicit FrameServer(uint32_t max_frame_size = FramedSocket::DEFAULT_MAX_FRAME);
    ~FrameServer();

    // Non-copyable
    FrameServer(const FrameServer&) = delete;
    FrameServer& operator=(const FrameServer&) = delete;

    /// Port 0 binds an ephemeral port; see port().
    Result<void> listen(const std::string& bind_address, uint16_t port,
                        int backlog = DEFAULT_BACKLOG);

    /// nullptr on timeout.
    Result<std::unique_ptr<FramedSocket>> accept(uint32_t timeout_ms);

    using RequestHandler = std::function<std::string(std::string_view)>;

    void serve(RequestHandler handler);
    void stop_serving();
    void close();

    [[nodiscard]] bool is_listening() const noexcept { return listen_fd_ >= 0; }
    [[nodiscard]] uint16_t port() const noexcept { return bound_port_; }

private:
    int listen_fd_ = -1;
    uint16_t bound_port_ = 0;
    uint32_t max_frame_size_;
    std::jthread serve_thread_;
};

/**
 * @brief Send one request frame and wait for one reply frame.
 */
Result<std::string> request_reply(const std::string& address, uint16_t port,
                                  std::string_view request, uint32_t timeout_ms);

}  // namespace beacon_mesh
