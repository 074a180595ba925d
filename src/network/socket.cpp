#include "vidup/network/socket.hpp"
#include <spdlog/spdlog.h>
#include <mutex>

namespace vidup::network {

using platform::close_socket;
using platform::io_length_t;
using platform::kInvalidSocket;
using platform::last_socket_error;

Result<void> Socket::initialize_platform() {
#ifdef VIDUP_PLATFORM_WINDOWS
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
    : socket_(kInvalidSocket)
    , is_connected_(false) {
}

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept
    : socket_(other.socket_)
    , is_connected_(other.is_connected_) {
    other.socket_ = kInvalidSocket;
    other.is_connected_ = false;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        is_connected_ = other.is_connected_;
        other.socket_ = kInvalidSocket;
        other.is_connected_ = false;
    }
    return *this;
}

Result<void> Socket::connect(const std::string& host, uint16_t port) {
    if (socket_ != kInvalidSocket) {
        return Err<void>(std::string("Socket already connected"));
    }
    auto init = initialize_platform();
    if (init.is_error()) {
        return init;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* results = nullptr;
    const std::string service = std::to_string(port);
    const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
    if (rc != 0) {
        return Err<void>("Failed to resolve " + host + ": " + gai_strerror(rc));
    }

    std::string last_error = "no addresses";
    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        socket_t candidate = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (candidate == kInvalidSocket) {
            last_error = last_socket_error();
            continue;
        }
        if (::connect(candidate, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen)) == 0) {
            socket_ = candidate;
            break;
        }
        last_error = last_socket_error();
        close_socket(candidate);
    }
    ::freeaddrinfo(results);

    if (socket_ == kInvalidSocket) {
        return Err<void>("Failed to connect to " + host + ":" + std::to_string(port) + ": " + last_error);
    }

    is_connected_ = true;
    spdlog::debug("Connected to {}:{} fd={}", host, port, socket_);
    return Ok();
}

Result<void> Socket::send_all(const std::vector<uint8_t>& data) {
    if (socket_ == kInvalidSocket) {
        return Err<void>(std::string("Socket not connected"));
    }

    size_t total = 0;
    while (total < data.size()) {
#ifdef VIDUP_PLATFORM_WINDOWS
        const int flags = 0;
#else
        const int flags = MSG_NOSIGNAL;
#endif
        auto sent = ::send(socket_,
                           reinterpret_cast<const char*>(data.data() + total),
                           static_cast<io_length_t>(data.size() - total), flags);
        if (sent < 0) {
            if (platform::last_error_is_interrupt()) {
                continue;
            }
            return Err<void>("Failed to send data: " + last_socket_error());
        }
        total += static_cast<size_t>(sent);
    }
    return Ok();
}

Result<std::vector<uint8_t>> Socket::receive(size_t max_size) {
    if (socket_ == kInvalidSocket) {
        return Err<std::vector<uint8_t>>(std::string("Socket not connected"));
    }

    std::vector<uint8_t> buffer(max_size);
    while (true) {
        auto received = ::recv(socket_,
                               reinterpret_cast<char*>(buffer.data()),
                               static_cast<io_length_t>(max_size), 0);
        if (received < 0) {
            if (platform::last_error_is_interrupt()) {
                continue;
            }
            if (platform::last_error_is_timeout()) {
                return Err<std::vector<uint8_t>>(std::string("Timed out waiting for data"));
            }
            return Err<std::vector<uint8_t>>("Failed to receive data: " + last_socket_error());
        }
        buffer.resize(static_cast<size_t>(received));
        return Ok(std::move(buffer));
    }
}

Result<void> Socket::set_timeout(std::chrono::milliseconds timeout) {
    if (socket_ == kInvalidSocket) {
        return Err<void>(std::string("Socket not connected"));
    }

#ifdef VIDUP_PLATFORM_WINDOWS
    DWORD value = static_cast<DWORD>(timeout.count());
    const char* option = reinterpret_cast<const char*>(&value);
    const int option_len = sizeof(value);
#else
    timeval value{};
    value.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    value.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    const void* option = &value;
    const socklen_t option_len = sizeof(value);
#endif

    if (setsockopt(socket_, SOL_SOCKET, SO_RCVTIMEO, option, option_len) < 0 ||
        setsockopt(socket_, SOL_SOCKET, SO_SNDTIMEO, option, option_len) < 0) {
        return Err<void>("Failed to set socket timeout: " + last_socket_error());
    }
    return Ok();
}

void Socket::close() {
    if (socket_ != kInvalidSocket) {
        close_socket(socket_);
        socket_ = kInvalidSocket;
        is_connected_ = false;
        spdlog::debug("Socket closed");
    }
}

} // namespace vidup::network
