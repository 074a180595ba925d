#pragma once

// Socket headers and descriptor helpers for the blocking client transport.
// Only network/socket.cpp should need anything beyond the type aliases.

#ifdef _WIN32
    #define VIDUP_PLATFORM_WINDOWS
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
#else
    #define VIDUP_PLATFORM_POSIX
    #include <sys/socket.h>
    #include <sys/time.h>
    #include <netinet/in.h>
    #include <arpa/inet.h>
    #include <netdb.h>
    #include <unistd.h>
#endif

#include <cerrno>
#include <cstring>
#include <string>

namespace vidup::platform {

#ifdef VIDUP_PLATFORM_WINDOWS
    using socket_t = SOCKET;
    constexpr socket_t kInvalidSocket = INVALID_SOCKET;
    /// send()/recv() take an int length on Winsock
    using io_length_t = int;
#else
    using socket_t = int;
    constexpr socket_t kInvalidSocket = -1;
    using io_length_t = size_t;
#endif

inline void close_socket(socket_t fd) {
#ifdef VIDUP_PLATFORM_WINDOWS
    ::closesocket(fd);
#else
    ::close(fd);
#endif
}

/// Text of the last socket error on this thread
inline std::string last_socket_error() {
#ifdef VIDUP_PLATFORM_WINDOWS
    return "WSA error " + std::to_string(WSAGetLastError());
#else
    return std::strerror(errno);
#endif
}

/// True when the last failed recv()/send() hit SO_RCVTIMEO or SO_SNDTIMEO
inline bool last_error_is_timeout() {
#ifdef VIDUP_PLATFORM_WINDOWS
    return WSAGetLastError() == WSAETIMEDOUT;
#else
    return errno == EAGAIN || errno == EWOULDBLOCK;
#endif
}

inline bool last_error_is_interrupt() {
#ifdef VIDUP_PLATFORM_WINDOWS
    return WSAGetLastError() == WSAEINTR;
#else
    return errno == EINTR;
#endif
}

} // namespace vidup::platform
