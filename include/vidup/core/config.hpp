#pragma once

#include "vidup/core/result.hpp"
#include "vidup/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace vidup {

/**
 * @brief Settings for the upload client and its HTTP transport
 *
 * Loaded from a JSON object whose keys match the field names. Missing keys
 * keep the defaults below; request_timeout is given in seconds
 * ("request_timeout_seconds").
 */
struct ClientConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8080;
    std::string base_path = "/api/uploads";
    std::uint64_t chunk_size = upload::kDefaultChunkSize;
    std::uint64_t resumable_threshold = upload::kResumableThreshold;
    std::chrono::seconds request_timeout{120};
    std::string journal_dir;  ///< Empty disables the session journal
    std::string log_level = "info";

    upload::UploadConfig upload_config() const {
        return upload::UploadConfig{chunk_size, resumable_threshold};
    }
};

/**
 * @brief Settings for the reference upload server
 */
struct ServerConfig {
    uint16_t port = 8080;
    std::filesystem::path data_root = "upload_data";
    std::uint64_t max_upload_bytes = 0;  ///< 0 means no quota
    std::string log_level = "info";
};

Result<ClientConfig> parse_client_config(const std::string& text);
Result<ServerConfig> parse_server_config(const std::string& text);

Result<ClientConfig> load_client_config(const std::filesystem::path& path);
Result<ServerConfig> load_server_config(const std::filesystem::path& path);

} // namespace vidup
