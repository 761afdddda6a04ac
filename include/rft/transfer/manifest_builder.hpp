#pragma once

#include "rft/config/transfer_config.hpp"
#include "rft/core/result.hpp"
#include "rft/transfer/directory_packager.hpp"
#include "rft/transfer/manifest.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace rft::transfer {

/**
 * @brief Manifest plus the scratch archives it refers to
 *
 * The archives are deleted when this object is destroyed, so it must outlive
 * every phase that reads them.
 */
struct BuiltManifest {
    TransferManifest manifest;
    std::vector<TempArchive> archives;

    void release_archives() noexcept;
};

class ContentManifestBuilder {
public:
    ContentManifestBuilder(const config::TransferConfig& config, DirectoryPackager& packager);

    /**
     * Hashes every source and maps it to remote_root/<basename>. Directories
     * are packaged first. Fails with SourceNotFound on the first path that is
     * neither a file nor a directory; archives built so far are released.
     */
    Result<BuiltManifest> build(const std::vector<std::filesystem::path>& sources,
                                const std::string& remote_root) const;

    [[nodiscard]] std::string remote_archive_path(const std::string& content_hash) const;

    [[nodiscard]] std::string remote_temp_path(const std::string& content_hash) const;

    /// Basename ignoring a trailing separator ("dir/" -> "dir").
    static std::string source_basename(const std::filesystem::path& source);

private:
    Result<TransferItem> file_item(const std::filesystem::path& source, const std::string& remote_root) const;
    Result<TransferItem> directory_item(const std::filesystem::path& source, const std::string& remote_root,
                                        std::vector<TempArchive>& archives) const;

    const config::TransferConfig& config_;
    DirectoryPackager& packager_;
};

} // namespace rft::transfer
