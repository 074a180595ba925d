#pragma once

#include "vidup/core/platform.hpp"
#include "vidup/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace vidup::network {

using platform::socket_t;

/**
 * @brief RAII wrapper around a blocking TCP client socket
 *
 * The descriptor is closed in the destructor. Copying is disabled since
 * two owners would close the same descriptor; moving transfers ownership.
 *
 * EXAMPLE:
 * @code
 * Socket socket;
 * auto connected = socket.connect("localhost", 8080);
 * if (connected.is_ok()) {
 *     socket.send_all(request.serialize());
 * }
 * @endcode
 */
class Socket {
public:
    Socket();
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    /**
     * @brief Resolve host and connect to the first address that accepts
     *
     * Accepts numeric addresses and host names (getaddrinfo).
     */
    Result<void> connect(const std::string& host, uint16_t port);

    /// Send the whole buffer, looping over partial writes
    Result<void> send_all(const std::vector<uint8_t>& data);

    /// One recv() call; an empty vector means the peer closed the connection
    Result<std::vector<uint8_t>> receive(size_t max_size);

    /// Applies to both send and receive; zero disables the timeout
    Result<void> set_timeout(std::chrono::milliseconds timeout);

    void close();
    bool is_valid() const { return socket_ != platform::kInvalidSocket; }
    bool is_connected() const { return is_connected_; }

    socket_t native_handle() const { return socket_; }

private:
    socket_t socket_;
    bool is_connected_;

    static Result<void> initialize_platform();
};

} // namespace vidup::network
