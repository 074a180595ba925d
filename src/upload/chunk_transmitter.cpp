#include "vidup/upload/chunk_transmitter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace vidup::upload {

std::uint64_t ChunkTransmitter::next_chunk_length(const UploadSession& session) noexcept {
    if (session.offset >= session.total_size) {
        return 0;
    }
    return std::min(session.chunk_size, session.total_size - session.offset);
}

UploadResult<std::uint64_t> ChunkTransmitter::send_chunk(const UploadSession& session,
                                                          MediaSource& source) {
    const std::uint64_t length = next_chunk_length(session);
    if (length == 0) {
        return Err<std::uint64_t>(transfer_error(session, "No bytes left to send"));
    }

    auto bytes = source.read(session.offset, static_cast<std::size_t>(length))
        .map_error([&](const std::string& message) {
            return transfer_error(session, "Failed to read source: " + message);
        });
    if (bytes.is_error()) {
        return Err<std::uint64_t>(bytes.error());
    }

    ChunkRequest request;
    request.session_id = session.session_id;
    request.start_offset = session.offset;
    request.data = bytes.take_value();

    spdlog::debug("Sending chunk session={} range=[{}, {})",
                  session.session_id, session.offset, session.offset + length);

    auto response = api_.transfer_chunk(request);
    if (response.is_error()) {
        return Err<std::uint64_t>(transfer_error(session, "Chunk rejected: " + response.error()));
    }

    // The server's offset is authoritative, but it must move forward and
    // stay within the file.
    const std::uint64_t next = response.value().start_offset;
    if (next <= session.offset) {
        return Err<std::uint64_t>(transfer_error(session,
            "Server did not advance offset (sent " + std::to_string(session.offset) +
            ", got " + std::to_string(next) + ")"));
    }
    if (next > session.total_size) {
        return Err<std::uint64_t>(transfer_error(session,
            "Server offset " + std::to_string(next) + " exceeds file size " +
            std::to_string(session.total_size)));
    }
    if (next != session.offset + length) {
        spdlog::warn("Server offset {} differs from local estimate {} for session {}",
                     next, session.offset + length, session.session_id);
    }

    return Ok(next);
}

UploadError ChunkTransmitter::transfer_error(const UploadSession& session, std::string message) const {
    UploadError error;
    error.kind = ErrorKind::Transfer;
    error.message = std::move(message);
    error.session_id = session.session_id;
    error.offset = session.offset;
    error.status = session.status;
    return error;
}

} // namespace vidup::upload
