#include "vidup/server/staging_store.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iomanip>
#include <sstream>

namespace vidup::server {
namespace fs = std::filesystem;

StagingStore::StagingStore(fs::path data_root)
    : data_root_(std::move(data_root)),
      staging_root_(data_root_ / "staging") {
    std::error_code ec;
    fs::create_directories(staging_root_, ec);
    if (ec) {
        spdlog::warn("Failed to create staging directory {}: {}", staging_root_.string(), ec.message());
    }
}

Result<void> StagingStore::append(const std::string& session_id,
                                  std::uint64_t offset,
                                  const std::vector<std::uint8_t>& data) const {
    const auto path = staging_path(session_id);

    std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
    if (!file) {
        std::ofstream create(path, std::ios::binary | std::ios::trunc);
        if (!create) {
            return Err<void>(std::string("Failed to create staging file: ") + path.string());
        }
        create.close();
        file.open(path, std::ios::in | std::ios::out | std::ios::binary);
    }
    if (!file) {
        return Err<void>(std::string("Failed to open staging file: ") + path.string());
    }

    file.seekp(static_cast<std::streamoff>(offset));
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file) {
        return Err<void>(std::string("Failed to write chunk at offset ") + std::to_string(offset) +
                         " for session " + session_id);
    }
    return Ok();
}

std::uint64_t StagingStore::staged_size(const std::string& session_id) const {
    std::error_code ec;
    const auto size = fs::file_size(staging_path(session_id), ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

Result<fs::path> StagingStore::publish(const std::string& session_id, const std::string& file_name) const {
    const auto source = staging_path(session_id);
    std::error_code ec;
    if (!fs::exists(source, ec)) {
        return Err<fs::path>(std::string("Staging file missing: ") + source.string());
    }

    const fs::path destination = data_root_ / (session_id + "-" + file_name);
    fs::rename(source, destination, ec);
    if (ec) {
        return Err<fs::path>(std::string("Failed to move staging file to ") + destination.string() +
                             ": " + ec.message());
    }
    return Ok(destination);
}

Result<std::string> StagingStore::staged_checksum(const std::string& session_id) const {
    const auto path = staging_path(session_id);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Err<std::string>(std::string("Staging file missing: ") + path.string());
    }
    return checksum(path);
}

Result<std::string> StagingStore::checksum(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(std::string("Failed to open ") + path.string());
    }

    const std::uint64_t offset = 0xcbf29ce484222325ULL;
    const std::uint64_t prime  = 0x100000001b3ULL;
    std::uint64_t hash = offset;
    char buffer[64 * 1024];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        const std::streamsize count = input.gcount();
        for (std::streamsize i = 0; i < count; ++i) {
            hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(buffer[i]));
            hash *= prime;
        }
    }

    std::ostringstream hex;
    hex << std::hex << std::setw(sizeof(hash) * 2) << std::setfill('0') << hash;
    return Ok(hex.str());
}

fs::path StagingStore::staging_path(const std::string& session_id) const {
    return staging_root_ / (session_id + ".part");
}

} // namespace vidup::server
