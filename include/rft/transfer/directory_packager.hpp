#pragma once

#include "rft/core/result.hpp"
#include "rft/transfer/id_generator.hpp"

#include <filesystem>
#include <memory>

namespace rft::transfer {

/**
 * @brief Local scratch archive, deleted when the owner goes away
 */
class TempArchive {
public:
    TempArchive() = default;
    explicit TempArchive(std::filesystem::path path) : path_(std::move(path)) {}
    ~TempArchive();

    TempArchive(const TempArchive&) = delete;
    TempArchive& operator=(const TempArchive&) = delete;

    TempArchive(TempArchive&& other) noexcept;
    TempArchive& operator=(TempArchive&& other) noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool active() const noexcept { return !path_.empty(); }

    /// Deletes the archive now. Safe to call more than once.
    void release() noexcept;

private:
    std::filesystem::path path_;
};

/**
 * @brief Turns a local directory into one archive file
 */
class DirectoryPackager {
public:
    virtual ~DirectoryPackager() = default;

    virtual Result<TempArchive> package(const std::filesystem::path& directory) = 0;
};

/**
 * @brief ZIP writer (deflate via zlib) with reproducible output
 *
 * Entries are the directory's contents relative to the directory itself,
 * '/'-separated and sorted, all stamped 2000-01-01 00:00. Identical trees
 * therefore produce identical bytes and identical content hashes, which keeps
 * unchanged directories clean on the next upload. No Zip64 support: entries
 * and archives above 4 GiB are rejected.
 */
class ZipDirectoryPackager : public DirectoryPackager {
public:
    explicit ZipDirectoryPackager(std::filesystem::path temp_dir,
                                  IdGenerator id_generator = default_id_generator());

    Result<TempArchive> package(const std::filesystem::path& directory) override;

    /// Writes the archive for directory to archive_path.
    static Result<void> write_zip(const std::filesystem::path& directory,
                                  const std::filesystem::path& archive_path);

private:
    std::filesystem::path temp_dir_;
    IdGenerator id_generator_;
};

} // namespace rft::transfer
