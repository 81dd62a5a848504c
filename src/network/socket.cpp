#include "lanshare/network/socket.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <mutex>

#ifdef LANSHARE_PLATFORM_WINDOWS
    #define close_socket closesocket
    using socklen_t = int;
#else
    #define close_socket ::close
    #include <sys/time.h>
#endif

namespace lanshare::network {

namespace {

std::string last_error() {
#ifdef LANSHARE_PLATFORM_WINDOWS
    return "WSA error " + std::to_string(WSAGetLastError());
#else
    return std::strerror(errno);
#endif
}

} // namespace

Result<void> Socket::initialize_platform() {
#ifdef LANSHARE_PLATFORM_WINDOWS
    static std::once_flag once;
    static bool ok = false;
    std::call_once(once, [] {
        WSADATA wsa_data;
        ok = WSAStartup(MAKEWORD(2, 2), &wsa_data) == 0;
    });
    if (!ok) {
        return Err<void>(std::string("Failed to initialize Winsock"));
    }
#endif
    return Ok();
}

Socket::Socket()
    : socket_(INVALID_SOCKET_VALUE) {
}

Socket::Socket(socket_t socket, std::string peer)
    : socket_(socket)
    , peer_(std::move(peer)) {
}

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept
    : socket_(other.socket_)
    , peer_(std::move(other.peer_)) {
    other.socket_ = INVALID_SOCKET_VALUE;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        peer_ = std::move(other.peer_);
        other.socket_ = INVALID_SOCKET_VALUE;
    }
    return *this;
}

Result<void> Socket::create() {
    if (socket_ != INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket already created"));
    }

    auto init = initialize_platform();
    if (init.is_error()) {
        return init;
    }

    socket_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>("Failed to create socket: " + last_error());
    }

    spdlog::debug("Socket created: fd={}", socket_);
    return Ok();
}

Result<void> Socket::bind(const std::string& address, uint16_t port) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket not created"));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (address == "0.0.0.0" || address.empty()) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) <= 0) {
        return Err<void>("Invalid address: " + address);
    }

    if (::bind(socket_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return Err<void>("Failed to bind to " + address + ":" + std::to_string(port) + ": " + last_error());
    }

    spdlog::debug("Socket bound to {}:{}", address, port);
    return Ok();
}

Result<void> Socket::listen(int backlog) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket not created"));
    }

    if (::listen(socket_, backlog) < 0) {
        return Err<void>("Failed to listen: " + last_error());
    }

    spdlog::debug("Socket listening with backlog={}", backlog);
    return Ok();
}

Result<std::unique_ptr<Socket>> Socket::accept() {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<std::unique_ptr<Socket>>(std::string("Socket not created"));
    }

    sockaddr_in client_addr{};
    socklen_t addr_len = sizeof(client_addr);

    socket_t client_socket = ::accept(socket_,
                                      reinterpret_cast<sockaddr*>(&client_addr),
                                      &addr_len);

    if (client_socket == INVALID_SOCKET_VALUE) {
        return Err<std::unique_ptr<Socket>>("Failed to accept connection: " + last_error());
    }

    char addr_str[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &client_addr.sin_addr, addr_str, INET_ADDRSTRLEN);
    std::string peer = std::string(addr_str) + ":" + std::to_string(ntohs(client_addr.sin_port));
    spdlog::debug("Accepted connection from {}", peer);

    return Ok(std::make_unique<Socket>(Socket(client_socket, std::move(peer))));
}

Result<uint16_t> Socket::local_port() const {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<uint16_t>(std::string("Socket not created"));
    }

    sockaddr_in addr{};
    socklen_t addr_len = sizeof(addr);
    if (::getsockname(socket_, reinterpret_cast<sockaddr*>(&addr), &addr_len) < 0) {
        return Err<uint16_t>("getsockname failed: " + last_error());
    }
    return Ok(static_cast<uint16_t>(ntohs(addr.sin_port)));
}

Result<size_t> Socket::send(const uint8_t* data, size_t length) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<size_t>(std::string("Socket not created"));
    }

#ifdef MSG_NOSIGNAL
    constexpr int flags = MSG_NOSIGNAL;  // Peer hang-up must not raise SIGPIPE
#else
    constexpr int flags = 0;
#endif
    auto sent = ::send(socket_, reinterpret_cast<const char*>(data), length, flags);
    if (sent < 0) {
        return Err<size_t>("Failed to send data: " + last_error());
    }

    return Ok(static_cast<size_t>(sent));
}

Result<void> Socket::send_all(const uint8_t* data, size_t length) {
    size_t total_sent = 0;
    while (total_sent < length) {
        auto sent = send(data + total_sent, length - total_sent);
        if (sent.is_error()) {
            return Err<void>(sent.error());
        }
        if (sent.value() == 0) {
            return Err<void>(std::string("Peer stopped accepting data"));
        }
        total_sent += sent.value();
    }
    return Ok();
}

Result<std::vector<uint8_t>> Socket::receive(size_t max_size) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<std::vector<uint8_t>>(std::string("Socket not created"));
    }

    std::vector<uint8_t> buffer(max_size);
    auto received = ::recv(socket_, reinterpret_cast<char*>(buffer.data()), max_size, 0);

    if (received < 0) {
        return Err<std::vector<uint8_t>>("Failed to receive data: " + last_error());
    }

    buffer.resize(static_cast<size_t>(received));
    return Ok(std::move(buffer));
}

Result<void> Socket::set_reuse_address(bool enable) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket not created"));
    }

    int opt = enable ? 1 : 0;
    if (setsockopt(socket_, SOL_SOCKET, SO_REUSEADDR,
                   reinterpret_cast<const char*>(&opt), sizeof(opt)) < 0) {
        return Err<void>("Failed to set SO_REUSEADDR: " + last_error());
    }

    return Ok();
}

Result<void> Socket::set_timeouts(std::chrono::seconds timeout) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket not created"));
    }

#ifdef LANSHARE_PLATFORM_WINDOWS
    DWORD value = static_cast<DWORD>(timeout.count() * 1000);
    const char* option = reinterpret_cast<const char*>(&value);
    int option_len = sizeof(value);
#else
    timeval value{};
    value.tv_sec = static_cast<time_t>(timeout.count());
    const void* option = &value;
    socklen_t option_len = sizeof(value);
#endif

    if (setsockopt(socket_, SOL_SOCKET, SO_RCVTIMEO, option, option_len) < 0 ||
        setsockopt(socket_, SOL_SOCKET, SO_SNDTIMEO, option, option_len) < 0) {
        return Err<void>("Failed to set socket timeouts: " + last_error());
    }
    return Ok();
}

void Socket::shutdown_both() {
    if (socket_ != INVALID_SOCKET_VALUE) {
#ifdef LANSHARE_PLATFORM_WINDOWS
        ::shutdown(socket_, SD_BOTH);
#else
        ::shutdown(socket_, SHUT_RDWR);
#endif
    }
}

void Socket::close() {
    if (socket_ != INVALID_SOCKET_VALUE) {
        close_socket(socket_);
        socket_ = INVALID_SOCKET_VALUE;
    }
}

} // namespace lanshare::network
