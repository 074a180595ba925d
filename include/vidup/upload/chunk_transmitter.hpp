#pragma once

#include "vidup/upload/media_source.hpp"
#include "vidup/upload/types.hpp"
#include "vidup/upload/upload_api.hpp"

#include <cstdint>

namespace vidup::upload {

/**
 * @brief Sends one byte range of the source and returns the server's next offset
 *
 * The range is always [session.offset, session.offset + min(chunk_size,
 * total_size - offset)). The transmitter never mutates the session; the
 * controller adopts the returned offset.
 */
class ChunkTransmitter {
public:
    explicit ChunkTransmitter(UploadApi& api) : api_(api) {}

    /// Length of the next range for the session (0 once offset == total_size)
    static std::uint64_t next_chunk_length(const UploadSession& session) noexcept;

    /**
     * @brief Read, send and validate one chunk
     *
     * Any failure (short read, transport error, server error, or a returned
     * offset that does not advance or overshoots total_size) is reported
     * as ErrorKind::Transfer. Nothing is retried.
     *
     * @return Server-confirmed next offset
     */
    UploadResult<std::uint64_t> send_chunk(const UploadSession& session, MediaSource& source);

private:
    UploadError transfer_error(const UploadSession& session, std::string message) const;

    UploadApi& api_;
};

} // namespace vidup::upload
