#pragma once

#include "vidup/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vidup::upload {

/**
 * @brief Random-access view of the bytes being uploaded
 *
 * The controller only ever asks for the range starting at the confirmed
 * offset, so implementations need no read-ahead or caching.
 */
class MediaSource {
public:
    virtual ~MediaSource() = default;

    virtual const std::string& name() const = 0;
    virtual std::uint64_t size() const = 0;

    /**
     * @brief Read exactly `length` bytes starting at `offset`
     *
     * A short read (range past the end, I/O error) is an error, never a
     * truncated buffer.
     */
    virtual Result<std::vector<std::uint8_t>> read(std::uint64_t offset, std::size_t length) = 0;
};

/**
 * @brief MediaSource backed by a file on disk
 */
class FileMediaSource : public MediaSource {
public:
    static Result<std::unique_ptr<FileMediaSource>> open(const std::filesystem::path& path);

    const std::string& name() const override { return name_; }
    std::uint64_t size() const override { return size_; }
    Result<std::vector<std::uint8_t>> read(std::uint64_t offset, std::size_t length) override;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    FileMediaSource(std::filesystem::path path, std::ifstream input, std::uint64_t size);

    std::filesystem::path path_;
    std::string name_;
    std::ifstream input_;
    std::uint64_t size_;
    std::mutex mutex_;
};

/**
 * @brief MediaSource over an in-memory buffer
 */
class MemoryMediaSource : public MediaSource {
public:
    MemoryMediaSource(std::string name, std::vector<std::uint8_t> data);

    const std::string& name() const override { return name_; }
    std::uint64_t size() const override { return data_.size(); }
    Result<std::vector<std::uint8_t>> read(std::uint64_t offset, std::size_t length) override;

    const std::vector<std::uint8_t>& data() const noexcept { return data_; }

private:
    std::string name_;
    std::vector<std::uint8_t> data_;
};

} // namespace vidup::upload
