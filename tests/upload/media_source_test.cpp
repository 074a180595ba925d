#include "vidup/upload/media_source.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using vidup::upload::FileMediaSource;
using vidup::upload::MemoryMediaSource;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = fs::temp_directory_path() / fs::path("vidup_media_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

} // namespace

TEST(FileMediaSourceTest, ReadsRangesFromDisk) {
    const auto dir = create_temp_dir();
    const fs::path file = dir / "clip.mp4";
    {
        std::ofstream out(file, std::ios::binary);
        out << "0123456789abcdef";
    }

    auto opened = FileMediaSource::open(file);
    ASSERT_TRUE(opened.is_ok()) << opened.error();
    auto& source = *opened.value();

    EXPECT_EQ(source.name(), "clip.mp4");
    EXPECT_EQ(source.size(), 16u);

    auto middle = source.read(4, 6);
    ASSERT_TRUE(middle.is_ok());
    EXPECT_EQ(std::string(middle.value().begin(), middle.value().end()), "456789");

    // Reads are random access; going backwards works too
    auto head = source.read(0, 3);
    ASSERT_TRUE(head.is_ok());
    EXPECT_EQ(std::string(head.value().begin(), head.value().end()), "012");

    auto tail = source.read(12, 4);
    ASSERT_TRUE(tail.is_ok());
    EXPECT_EQ(std::string(tail.value().begin(), tail.value().end()), "cdef");

    fs::remove_all(dir);
}

TEST(FileMediaSourceTest, ReadPastEndIsError) {
    const auto dir = create_temp_dir();
    const fs::path file = dir / "short.bin";
    {
        std::ofstream out(file, std::ios::binary);
        out << "abc";
    }

    auto opened = FileMediaSource::open(file);
    ASSERT_TRUE(opened.is_ok());

    EXPECT_TRUE(opened.value()->read(2, 2).is_error());
    EXPECT_TRUE(opened.value()->read(4, 0).is_error());

    fs::remove_all(dir);
}

TEST(FileMediaSourceTest, OpenRejectsMissingFileAndDirectory) {
    const auto dir = create_temp_dir();

    EXPECT_TRUE(FileMediaSource::open(dir / "missing.mp4").is_error());
    EXPECT_TRUE(FileMediaSource::open(dir).is_error());

    fs::remove_all(dir);
}

TEST(MemoryMediaSourceTest, ReadsExactRanges) {
    MemoryMediaSource source("buffer.bin", {1, 2, 3, 4, 5});

    EXPECT_EQ(source.name(), "buffer.bin");
    EXPECT_EQ(source.size(), 5u);

    auto bytes = source.read(1, 3);
    ASSERT_TRUE(bytes.is_ok());
    EXPECT_EQ(bytes.value(), (std::vector<std::uint8_t>{2, 3, 4}));

    auto empty = source.read(5, 0);
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(empty.value().empty());

    EXPECT_TRUE(source.read(3, 3).is_error());
    EXPECT_TRUE(source.read(6, 0).is_error());
}
