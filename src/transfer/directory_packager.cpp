#include "rft/transfer/directory_packager.hpp"

#include <spdlog/spdlog.h>
#include <zlib.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <string>
#include <system_error>
#include <vector>

namespace rft::transfer {
namespace fs = std::filesystem;

namespace {

constexpr std::uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr std::uint32_t kCentralHeaderSignature = 0x02014b50;
constexpr std::uint32_t kEndOfCentralDirSignature = 0x06054b50;
constexpr std::uint16_t kVersion = 20;
constexpr std::uint16_t kFlagUtf8Names = 0x0800;
constexpr std::uint16_t kMethodStored = 0;
constexpr std::uint16_t kMethodDeflated = 8;
constexpr std::uint32_t kDosAttrDirectory = 0x10;

// 2000-01-01 00:00:00 in MS-DOS date/time format
constexpr std::uint16_t kDosTime = 0;
constexpr std::uint16_t kDosDate = ((2000 - 1980) << 9) | (1 << 5) | 1;

// Offset of the crc32 field inside a local file header
constexpr std::streamoff kLocalCrcOffset = 14;

constexpr std::size_t kBlockSize = 64 * 1024;

struct ZipEntry {
    std::string name;
    bool is_directory = false;
    std::uint16_t method = kMethodStored;
    std::uint32_t crc = 0;
    std::uint64_t compressed_size = 0;
    std::uint64_t uncompressed_size = 0;
    std::uint64_t header_offset = 0;
};

void put16(std::ostream& out, std::uint16_t value) {
    const char bytes[2] = {static_cast<char>(value & 0xFF), static_cast<char>((value >> 8) & 0xFF)};
    out.write(bytes, 2);
}

void put32(std::ostream& out, std::uint32_t value) {
    const char bytes[4] = {static_cast<char>(value & 0xFF), static_cast<char>((value >> 8) & 0xFF),
                           static_cast<char>((value >> 16) & 0xFF), static_cast<char>((value >> 24) & 0xFF)};
    out.write(bytes, 4);
}

bool fits32(std::uint64_t value) {
    return value <= std::numeric_limits<std::uint32_t>::max();
}

void write_local_header(std::ostream& out, const ZipEntry& entry) {
    put32(out, kLocalHeaderSignature);
    put16(out, kVersion);
    put16(out, kFlagUtf8Names);
    put16(out, entry.method);
    put16(out, kDosTime);
    put16(out, kDosDate);
    put32(out, entry.crc);
    put32(out, static_cast<std::uint32_t>(entry.compressed_size));
    put32(out, static_cast<std::uint32_t>(entry.uncompressed_size));
    put16(out, static_cast<std::uint16_t>(entry.name.size()));
    put16(out, 0);
    out.write(entry.name.data(), static_cast<std::streamsize>(entry.name.size()));
}

void write_central_header(std::ostream& out, const ZipEntry& entry) {
    put32(out, kCentralHeaderSignature);
    put16(out, kVersion);
    put16(out, kVersion);
    put16(out, kFlagUtf8Names);
    put16(out, entry.method);
    put16(out, kDosTime);
    put16(out, kDosDate);
    put32(out, entry.crc);
    put32(out, static_cast<std::uint32_t>(entry.compressed_size));
    put32(out, static_cast<std::uint32_t>(entry.uncompressed_size));
    put16(out, static_cast<std::uint16_t>(entry.name.size()));
    put16(out, 0); // extra
    put16(out, 0); // comment
    put16(out, 0); // disk number
    put16(out, 0); // internal attributes
    put32(out, entry.is_directory ? kDosAttrDirectory : 0);
    put32(out, static_cast<std::uint32_t>(entry.header_offset));
    out.write(entry.name.data(), static_cast<std::streamsize>(entry.name.size()));
}

// Streams source through raw deflate into out, filling crc and sizes.
Result<void> deflate_file(const fs::path& source, std::ostream& out, ZipEntry& entry) {
    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return Err<void>(ErrorKind::LocalIo, "Failed to open file for archiving: " + source.string());
    }

    z_stream stream{};
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return Err<void>(ErrorKind::LocalIo, "deflateInit2 failed for " + source.string());
    }

    std::vector<char> in_buffer(kBlockSize);
    std::vector<char> out_buffer(kBlockSize);
    uLong crc = crc32(0L, Z_NULL, 0);
    Result<void> status = Ok();

    int flush = Z_NO_FLUSH;
    do {
        input.read(in_buffer.data(), static_cast<std::streamsize>(in_buffer.size()));
        const auto count = static_cast<std::size_t>(input.gcount());
        if (input.bad()) {
            status = Err<void>(ErrorKind::LocalIo, "Failed to read file for archiving: " + source.string());
            break;
        }
        flush = input.eof() ? Z_FINISH : Z_NO_FLUSH;

        crc = crc32(crc, reinterpret_cast<const Bytef*>(in_buffer.data()), static_cast<uInt>(count));
        entry.uncompressed_size += count;

        stream.next_in = reinterpret_cast<Bytef*>(in_buffer.data());
        stream.avail_in = static_cast<uInt>(count);
        do {
            stream.next_out = reinterpret_cast<Bytef*>(out_buffer.data());
            stream.avail_out = static_cast<uInt>(out_buffer.size());
            const int rc = deflate(&stream, flush);
            if (rc == Z_STREAM_ERROR) {
                status = Err<void>(ErrorKind::LocalIo, "deflate failed for " + source.string());
                break;
            }
            const std::size_t produced = out_buffer.size() - stream.avail_out;
            out.write(out_buffer.data(), static_cast<std::streamsize>(produced));
            entry.compressed_size += produced;
        } while (stream.avail_out == 0);
    } while (status.is_ok() && flush != Z_FINISH);

    deflateEnd(&stream);
    if (status.is_error()) {
        return status;
    }

    entry.crc = static_cast<std::uint32_t>(crc);
    if (!fits32(entry.uncompressed_size) || !fits32(entry.compressed_size)) {
        return Err<void>(ErrorKind::LocalIo, "File too large for archive (no Zip64 support): " + source.string());
    }
    return Ok();
}

std::vector<std::pair<std::string, fs::path>> collect_entries(const fs::path& directory, std::error_code& ec) {
    std::vector<std::pair<std::string, fs::path>> entries;
    for (auto it = fs::recursive_directory_iterator(directory, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::string name = fs::relative(entry.path(), directory).generic_string();
        if (entry.is_directory()) {
            entries.emplace_back(name + "/", entry.path());
        } else if (entry.is_regular_file()) {
            entries.emplace_back(std::move(name), entry.path());
        }
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
    return entries;
}

} // namespace

TempArchive::~TempArchive() {
    release();
}

TempArchive::TempArchive(TempArchive&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempArchive& TempArchive::operator=(TempArchive&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void TempArchive::release() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove scratch archive {}: {}", path_.string(), ec.message());
    } else {
        spdlog::debug("Cleaned up scratch archive {}", path_.string());
    }
    path_.clear();
}

ZipDirectoryPackager::ZipDirectoryPackager(fs::path temp_dir, IdGenerator id_generator)
    : temp_dir_(std::move(temp_dir)), id_generator_(std::move(id_generator)) {}

Result<TempArchive> ZipDirectoryPackager::package(const fs::path& directory) {
    std::error_code ec;
    fs::create_directories(temp_dir_, ec);
    if (ec && !fs::exists(temp_dir_)) {
        return Err<TempArchive>(ErrorKind::LocalIo, "Failed to create temp directory: " + temp_dir_.string());
    }

    TempArchive archive(temp_dir_ / ("rft-upload-" + id_generator_() + ".zip"));
    auto written = write_zip(directory, archive.path());
    if (written.is_error()) {
        return Err<TempArchive>(written.error());
    }

    spdlog::debug("Packaged directory {} into {}", directory.string(), archive.path().string());
    return Ok(std::move(archive));
}

Result<void> ZipDirectoryPackager::write_zip(const fs::path& directory, const fs::path& archive_path) {
    if (!fs::is_directory(directory)) {
        return Err<void>(ErrorKind::SourceNotFound, "No such directory: " + directory.string());
    }

    std::error_code ec;
    const auto sources = collect_entries(directory, ec);
    if (ec) {
        return Err<void>(ErrorKind::LocalIo, "Failed to list " + directory.string() + ": " + ec.message());
    }
    if (sources.size() > std::numeric_limits<std::uint16_t>::max()) {
        return Err<void>(ErrorKind::LocalIo, "Too many entries for archive (no Zip64 support): " + directory.string());
    }

    std::ofstream out(archive_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Err<void>(ErrorKind::LocalIo, "Failed to create archive: " + archive_path.string());
    }

    std::vector<ZipEntry> entries;
    entries.reserve(sources.size());

    for (const auto& [name, path] : sources) {
        ZipEntry entry;
        entry.name = name;
        entry.is_directory = name.back() == '/';
        entry.method = entry.is_directory ? kMethodStored : kMethodDeflated;
        entry.header_offset = static_cast<std::uint64_t>(out.tellp());

        write_local_header(out, entry);
        if (!entry.is_directory) {
            auto deflated = deflate_file(path, out, entry);
            if (deflated.is_error()) {
                return deflated;
            }

            // Patch crc and sizes now that they are known
            const auto end = out.tellp();
            out.seekp(static_cast<std::streamoff>(entry.header_offset) + kLocalCrcOffset);
            put32(out, entry.crc);
            put32(out, static_cast<std::uint32_t>(entry.compressed_size));
            put32(out, static_cast<std::uint32_t>(entry.uncompressed_size));
            out.seekp(end);
        }

        if (!fits32(entry.header_offset)) {
            return Err<void>(ErrorKind::LocalIo, "Archive too large (no Zip64 support): " + archive_path.string());
        }
        entries.push_back(std::move(entry));
    }

    const auto central_offset = static_cast<std::uint64_t>(out.tellp());
    for (const auto& entry : entries) {
        write_central_header(out, entry);
    }
    const auto central_size = static_cast<std::uint64_t>(out.tellp()) - central_offset;
    if (!fits32(central_offset) || !fits32(central_size)) {
        return Err<void>(ErrorKind::LocalIo, "Archive too large (no Zip64 support): " + archive_path.string());
    }

    put32(out, kEndOfCentralDirSignature);
    put16(out, 0);
    put16(out, 0);
    put16(out, static_cast<std::uint16_t>(entries.size()));
    put16(out, static_cast<std::uint16_t>(entries.size()));
    put32(out, static_cast<std::uint32_t>(central_size));
    put32(out, static_cast<std::uint32_t>(central_offset));
    put16(out, 0);

    out.flush();
    if (!out) {
        return Err<void>(ErrorKind::LocalIo, "Failed to write archive: " + archive_path.string());
    }
    return Ok();
}

} // namespace rft::transfer
