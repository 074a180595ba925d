#pragma once

#include "vidup/core/result.hpp"
#include "vidup/upload/types.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace vidup::upload {

/**
 * @brief One persisted upload descriptor
 *
 * offset is the last value the server confirmed before the entry was
 * written. It is a display hint only: resuming always re-queries the server.
 */
struct JournalEntry {
    std::string key;
    std::string session_id;
    std::string file_name;
    std::uint64_t total_size = 0;
    std::uint64_t offset = 0;
    UploadMetadata metadata;
    UploadStatus status = UploadStatus::Idle;
};

/**
 * @brief Durable store of upload descriptors, one JSON file per upload key
 *
 * Lets a process that restarted find the session id of an interrupted
 * upload without the user supplying it. Opt-in: a controller without an
 * attached journal keeps its descriptor in memory only.
 *
 * Layout: <directory>/<key>.json
 */
class SessionJournal {
public:
    explicit SessionJournal(std::filesystem::path directory);

    Result<void> save(const std::string& key, const UploadSession& session);

    Result<JournalEntry> load(const std::string& key) const;

    Result<void> remove(const std::string& key);

    bool contains(const std::string& key) const;

    /// All readable entries; unreadable files are skipped with a warning
    std::vector<JournalEntry> list() const;

    const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    Result<std::filesystem::path> path_for(const std::string& key) const;

    std::filesystem::path directory_;
    mutable std::mutex mutex_;
};

} // namespace vidup::upload
