#include "rft/transfer/directory_packager.hpp"
#include "rft/transfer/hashing.hpp"

#include <gtest/gtest.h>
#include <zlib.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using rft::ErrorKind;
using rft::transfer::TempArchive;
using rft::transfer::ZipDirectoryPackager;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("rft_packager_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

rft::transfer::IdGenerator counting_ids() {
    auto next = std::make_shared<int>(0);
    return [next] { return "id" + std::to_string((*next)++); };
}

std::uint16_t read16(const std::string& bytes, std::size_t offset) {
    return static_cast<std::uint16_t>(static_cast<unsigned char>(bytes[offset]) |
                                      (static_cast<unsigned char>(bytes[offset + 1]) << 8));
}

std::uint32_t read32(const std::string& bytes, std::size_t offset) {
    return static_cast<std::uint32_t>(read16(bytes, offset)) |
           (static_cast<std::uint32_t>(read16(bytes, offset + 2)) << 16);
}

/// Entry names from the central directory, in archive order.
std::vector<std::string> central_names(const std::string& zip) {
    const std::size_t eocd = zip.rfind(std::string("PK\x05\x06", 4));
    const std::uint16_t count = read16(zip, eocd + 10);
    std::size_t offset = read32(zip, eocd + 16);

    std::vector<std::string> names;
    for (std::uint16_t i = 0; i < count; ++i) {
        const std::uint16_t name_length = read16(zip, offset + 28);
        const std::uint16_t extra_length = read16(zip, offset + 30);
        const std::uint16_t comment_length = read16(zip, offset + 32);
        names.push_back(zip.substr(offset + 46, name_length));
        offset += 46 + name_length + extra_length + comment_length;
    }
    return names;
}

/// Inflates the first local entry and returns its bytes.
std::string inflate_first_entry(const std::string& zip) {
    const std::uint32_t compressed = read32(zip, 18);
    const std::uint32_t uncompressed = read32(zip, 22);
    const std::size_t data = 30 + read16(zip, 26) + read16(zip, 28);

    std::string out(uncompressed, '\0');
    z_stream stream{};
    inflateInit2(&stream, -MAX_WBITS);
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(zip.data() + data));
    stream.avail_in = compressed;
    stream.next_out = reinterpret_cast<Bytef*>(out.data());
    stream.avail_out = uncompressed;
    inflate(&stream, Z_FINISH);
    inflateEnd(&stream);
    return out;
}

} // namespace

TEST(ZipDirectoryPackagerTest, SameTreeProducesSameBytes) {
    const auto source = create_temp_dir();
    write_file(source / "b.txt", "second");
    write_file(source / "a.txt", "first");
    write_file(source / "nested" / "deep.bin", std::string(5000, 'z'));

    const auto scratch = create_temp_dir();
    ZipDirectoryPackager packager(scratch, counting_ids());

    auto first = packager.package(source);
    ASSERT_TRUE(first.is_ok()) << first.error().message;
    const auto first_hash = rft::transfer::md5_file(first.value().path());

    // Touching mtimes must not change the archive
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    write_file(source / "a.txt", "first");

    auto second = packager.package(source);
    ASSERT_TRUE(second.is_ok());
    EXPECT_NE(first.value().path(), second.value().path());
    EXPECT_EQ(first_hash.value(), rft::transfer::md5_file(second.value().path()).value());

    fs::remove_all(source);
    fs::remove_all(scratch);
}

TEST(ZipDirectoryPackagerTest, EntriesAreSortedRelativePaths) {
    const auto source = create_temp_dir();
    write_file(source / "zeta.txt", "z");
    write_file(source / "alpha" / "one.txt", "1");
    fs::create_directories(source / "empty");

    const auto scratch = create_temp_dir();
    const fs::path archive = scratch / "tree.zip";
    ASSERT_TRUE(ZipDirectoryPackager::write_zip(source, archive).is_ok());

    const std::vector<std::string> expected{"alpha/", "alpha/one.txt", "empty/", "zeta.txt"};
    EXPECT_EQ(central_names(read_file(archive)), expected);

    fs::remove_all(source);
    fs::remove_all(scratch);
}

TEST(ZipDirectoryPackagerTest, DeflatedEntryInflatesToOriginal) {
    const auto source = create_temp_dir();
    std::string content;
    for (int i = 0; i < 100000; ++i) {
        content += std::to_string(i % 97);
    }
    write_file(source / "data.txt", content);

    const auto scratch = create_temp_dir();
    const fs::path archive = scratch / "data.zip";
    ASSERT_TRUE(ZipDirectoryPackager::write_zip(source, archive).is_ok());

    const std::string zip = read_file(archive);
    ASSERT_EQ(zip.compare(0, 4, std::string("PK\x03\x04", 4)), 0);
    EXPECT_EQ(read16(zip, 8), 8);  // deflate
    EXPECT_EQ(inflate_first_entry(zip), content);
    EXPECT_EQ(read32(zip, 14), static_cast<std::uint32_t>(crc32(0L, reinterpret_cast<const Bytef*>(content.data()),
                                                                 static_cast<uInt>(content.size()))));

    fs::remove_all(source);
    fs::remove_all(scratch);
}

TEST(ZipDirectoryPackagerTest, MissingDirectoryIsSourceNotFound) {
    const auto scratch = create_temp_dir();
    ZipDirectoryPackager packager(scratch, counting_ids());

    auto result = packager.package(scratch / "nope");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::SourceNotFound);
    EXPECT_TRUE(fs::is_empty(scratch));

    fs::remove_all(scratch);
}

TEST(TempArchiveTest, RemovesFileWhenDestroyedOrReleased) {
    const auto scratch = create_temp_dir();
    const fs::path first = scratch / "first.zip";
    const fs::path second = scratch / "second.zip";
    write_file(first, "x");
    write_file(second, "y");

    {
        TempArchive archive(first);
        EXPECT_TRUE(archive.active());
    }
    EXPECT_FALSE(fs::exists(first));

    TempArchive archive(second);
    archive.release();
    EXPECT_FALSE(fs::exists(second));
    EXPECT_FALSE(archive.active());
    archive.release();

    fs::remove_all(scratch);
}

TEST(TempArchiveTest, MoveTransfersOwnership) {
    const auto scratch = create_temp_dir();
    const fs::path path = scratch / "moved.zip";
    write_file(path, "x");

    TempArchive target;
    {
        TempArchive source(path);
        target = std::move(source);
    }
    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(target.path(), path);

    target.release();
    EXPECT_FALSE(fs::exists(path));

    fs::remove_all(scratch);
}
