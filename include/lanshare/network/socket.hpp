#pragma once

#include "lanshare/core/platform.hpp"
#include "lanshare/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace lanshare::network {

#ifdef LANSHARE_PLATFORM_WINDOWS
    using socket_t = SOCKET;
    constexpr socket_t INVALID_SOCKET_VALUE = INVALID_SOCKET;
#else
    using socket_t = int;
    constexpr socket_t INVALID_SOCKET_VALUE = -1;
#endif

/**
 * @brief Blocking TCP socket used by the share server's listener and connections
 *
 * Accepted sockets get send/receive timeouts so a stalled peer releases its
 * worker instead of holding it forever.
 */
class Socket {
public:
    Socket();
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    Result<void> create();
    Result<void> bind(const std::string& address, uint16_t port);
    Result<void> listen(int backlog = 128);
    Result<std::unique_ptr<Socket>> accept();

    /**
     * @brief Port actually bound, which differs from the requested one for port 0
     */
    Result<uint16_t> local_port() const;

    Result<size_t> send(const uint8_t* data, size_t length);

    /**
     * @brief Send every byte, looping over partial writes
     */
    Result<void> send_all(const uint8_t* data, size_t length);
    Result<void> send_all(const std::vector<uint8_t>& data) {
        return send_all(data.data(), data.size());
    }

    Result<std::vector<uint8_t>> receive(size_t max_size);

    Result<void> set_reuse_address(bool enable);
    Result<void> set_timeouts(std::chrono::seconds timeout);

    /**
     * @brief Unblock a thread waiting in accept() or receive()
     */
    void shutdown_both();
    void close();
    bool is_valid() const { return socket_ != INVALID_SOCKET_VALUE; }

    const std::string& peer() const { return peer_; }
    socket_t native_handle() const { return socket_; }

private:
    Socket(socket_t socket, std::string peer);

    socket_t socket_;
    std::string peer_;

    static Result<void> initialize_platform();
};

} // namespace lanshare::network
