#include "rft/transfer/manifest_builder.hpp"

#include "rft/transfer/hashing.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace rft::transfer {
namespace fs = std::filesystem;

void BuiltManifest::release_archives() noexcept {
    for (auto& archive : archives) {
        archive.release();
    }
    archives.clear();
}

ContentManifestBuilder::ContentManifestBuilder(const config::TransferConfig& config, DirectoryPackager& packager)
    : config_(config), packager_(packager) {}

std::string ContentManifestBuilder::source_basename(const fs::path& source) {
    fs::path trimmed = source;
    while (!trimmed.has_filename() && trimmed.has_parent_path() && trimmed != trimmed.parent_path()) {
        trimmed = trimmed.parent_path();
    }
    return trimmed.filename().string();
}

std::string ContentManifestBuilder::remote_archive_path(const std::string& content_hash) const {
    return config_.remote_join(config_.remote_upload_dir(), "tmpzip-" + content_hash + ".zip");
}

std::string ContentManifestBuilder::remote_temp_path(const std::string& content_hash) const {
    return config_.remote_join(config_.remote_temp_dir, "b64-" + content_hash + ".txt");
}

Result<TransferItem> ContentManifestBuilder::file_item(const fs::path& source, const std::string& remote_root) const {
    spdlog::debug("creating hash for file {}", source.string());

    auto hash = md5_file(source);
    if (hash.is_error()) {
        return Err<TransferItem>(hash.error());
    }

    std::error_code ec;
    const auto size = fs::file_size(source, ec);
    if (ec) {
        return Err<TransferItem>(ErrorKind::LocalIo, "Failed to stat " + source.string() + ": " + ec.message());
    }

    TransferItem item;
    item.content_hash = hash.value();
    item.source = source;
    item.destination = config_.remote_join(remote_root, source_basename(source));
    item.size = size;
    return Ok(std::move(item));
}

Result<TransferItem> ContentManifestBuilder::directory_item(const fs::path& source,
                                                            const std::string& remote_root,
                                                            std::vector<TempArchive>& archives) const {
    spdlog::debug("creating hash for directory {}", source.string());

    auto archive = packager_.package(source);
    if (archive.is_error()) {
        return Err<TransferItem>(archive.error());
    }
    const fs::path archive_path = archive.value().path();
    archives.push_back(std::move(archive.value()));

    auto hash = md5_file(archive_path);
    if (hash.is_error()) {
        return Err<TransferItem>(hash.error());
    }

    std::error_code ec;
    const auto size = fs::file_size(archive_path, ec);
    if (ec) {
        return Err<TransferItem>(ErrorKind::LocalIo, "Failed to stat " + archive_path.string() + ": " + ec.message());
    }

    TransferItem item;
    item.content_hash = hash.value();
    item.source = source;
    item.archive_path = archive_path;
    item.remote_archive_path = remote_archive_path(item.content_hash);
    item.destination = config_.remote_join(remote_root, source_basename(source));
    item.size = size;
    return Ok(std::move(item));
}

Result<BuiltManifest> ContentManifestBuilder::build(const std::vector<fs::path>& sources,
                                                    const std::string& remote_root) const {
    std::vector<fs::path> resolved;
    resolved.reserve(sources.size());

    // Every source must exist before any directory is packaged
    for (const auto& raw : sources) {
        std::error_code ec;
        const fs::path source = fs::absolute(raw, ec);
        if (ec || !(fs::is_regular_file(source, ec) || fs::is_directory(source, ec))) {
            spdlog::error("Failed to add {}: no such file or directory", raw.string());
            return Err<BuiltManifest>(ErrorKind::SourceNotFound, "No such file or directory " + raw.string());
        }
        resolved.push_back(source);
    }

    BuiltManifest built;

    for (const auto& source : resolved) {
        std::error_code ec;

        Result<TransferItem> item = Err<TransferItem>(ErrorKind::SourceNotFound,
                                                      "No such file or directory " + source.string());
        if (fs::is_regular_file(source, ec)) {
            item = file_item(source, remote_root);
        } else if (fs::is_directory(source, ec)) {
            item = directory_item(source, remote_root, built.archives);
        }

        if (item.is_error()) {
            spdlog::error("Failed to add {}: {}", source.string(), item.error().message);
            return Err<BuiltManifest>(item.error());
        }

        const std::string content_hash = item.value().content_hash;
        const std::string destination = item.value().destination;
        if (!built.manifest.insert(std::move(item.value()))) {
            const auto* kept = built.manifest.find(content_hash);
            spdlog::warn("{} has the same content ({}) as {}; transferring once to {} and ignoring destination {}",
                         source.string(), content_hash, kept->source.string(), kept->destination, destination);
        }
    }

    return Ok(std::move(built));
}

} // namespace rft::transfer
