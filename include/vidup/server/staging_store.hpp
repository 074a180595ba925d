#pragma once

#include "vidup/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace vidup::server {

/**
 * @brief On-disk byte staging for in-progress uploads
 *
 * Layout:
 *   <data_root>/staging/<session_id>.part   bytes received so far
 *   <data_root>/<session_id>-<file_name>    published file
 *
 * The store does not track offsets; UploadService decides which writes are
 * legal and calls append() only with the committed offset.
 */
class StagingStore {
public:
    explicit StagingStore(std::filesystem::path data_root);

    /// Write `data` at `offset` of the session's staging file, creating it on first use
    Result<void> append(const std::string& session_id,
                        std::uint64_t offset,
                        const std::vector<std::uint8_t>& data) const;

    /// Size of the staging file (0 if it does not exist)
    std::uint64_t staged_size(const std::string& session_id) const;

    /**
     * @brief Move the staging file to its published location
     * @return Published path
     */
    Result<std::filesystem::path> publish(const std::string& session_id,
                                          const std::string& file_name) const;

    /// checksum() of the session's staging file
    Result<std::string> staged_checksum(const std::string& session_id) const;

    /// FNV-1a of a file's content as 16 hex digits
    static Result<std::string> checksum(const std::filesystem::path& path);

    const std::filesystem::path& data_root() const noexcept { return data_root_; }
    const std::filesystem::path& staging_root() const noexcept { return staging_root_; }

private:
    std::filesystem::path staging_path(const std::string& session_id) const;

    std::filesystem::path data_root_;
    std::filesystem::path staging_root_;
};

} // namespace vidup::server
