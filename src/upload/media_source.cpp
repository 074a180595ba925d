#include "vidup/upload/media_source.hpp"

#include <memory>

namespace vidup::upload {
namespace fs = std::filesystem;

Result<std::unique_ptr<FileMediaSource>> FileMediaSource::open(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Err<std::unique_ptr<FileMediaSource>>(std::string("Not a regular file: ") + path.string());
    }

    const auto file_size = fs::file_size(path, ec);
    if (ec) {
        return Err<std::unique_ptr<FileMediaSource>>(std::string("Failed to stat file: ") + path.string());
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::unique_ptr<FileMediaSource>>(std::string("Failed to open source file: ") + path.string());
    }

    return Ok(std::unique_ptr<FileMediaSource>(
        new FileMediaSource(path, std::move(input), static_cast<std::uint64_t>(file_size))));
}

FileMediaSource::FileMediaSource(fs::path path, std::ifstream input, std::uint64_t size)
    : path_(std::move(path)),
      name_(path_.filename().string()),
      input_(std::move(input)),
      size_(size) {}

Result<std::vector<std::uint8_t>> FileMediaSource::read(std::uint64_t offset, std::size_t length) {
    if (offset > size_ || length > size_ - offset) {
        return Err<std::vector<std::uint8_t>>(std::string("Read past end of ") + name_ +
                                              " at offset " + std::to_string(offset));
    }

    std::lock_guard lock(mutex_);
    input_.clear();
    input_.seekg(static_cast<std::streamoff>(offset));
    if (!input_) {
        return Err<std::vector<std::uint8_t>>(std::string("Failed to seek in ") + name_);
    }

    std::vector<std::uint8_t> buffer(length);
    input_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    if (static_cast<std::size_t>(input_.gcount()) != length) {
        return Err<std::vector<std::uint8_t>>(std::string("Short read from ") + name_ +
                                              " at offset " + std::to_string(offset));
    }
    return Ok(std::move(buffer));
}

MemoryMediaSource::MemoryMediaSource(std::string name, std::vector<std::uint8_t> data)
    : name_(std::move(name)), data_(std::move(data)) {}

Result<std::vector<std::uint8_t>> MemoryMediaSource::read(std::uint64_t offset, std::size_t length) {
    if (offset > data_.size() || length > data_.size() - offset) {
        return Err<std::vector<std::uint8_t>>(std::string("Read past end of ") + name_ +
                                              " at offset " + std::to_string(offset));
    }
    const auto begin = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    return Ok(std::vector<std::uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(length)));
}

} // namespace vidup::upload
