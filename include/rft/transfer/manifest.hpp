#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rft::transfer {

/**
 * @brief One file, or one directory packaged as an archive, being moved
 */
struct TransferItem {
    std::string content_hash;                          ///< MD5 of the payload; manifest key
    std::filesystem::path source;                      ///< File, or directory whose archive is the payload
    std::optional<std::filesystem::path> archive_path; ///< Local archive (directories only)
    std::optional<std::string> remote_archive_path;    ///< Remote tmpzip (directories only)
    std::string destination;
    std::uint64_t size = 0;
    std::vector<std::filesystem::path> aliases;        ///< Other sources with identical content

    // check phase
    std::optional<bool> remote_exists;
    std::optional<bool> dirty;
    std::optional<bool> verified;
    std::optional<std::string> remote_hash;

    // upload phase
    std::optional<std::string> remote_temp_path;
    std::optional<std::uint64_t> chunk_count;
    std::optional<std::uint64_t> bytes_transferred;

    [[nodiscard]] bool is_archive() const noexcept { return archive_path.has_value(); }
    [[nodiscard]] bool is_dirty() const noexcept { return dirty.value_or(false); }

    /// Local file whose bytes are sent: the archive for directories.
    [[nodiscard]] const std::filesystem::path& payload_path() const noexcept {
        return archive_path ? *archive_path : source;
    }
};

struct CheckEntry {
    std::optional<bool> remote_exists;
    std::optional<bool> dirty;
    std::optional<bool> verified;
    std::optional<std::string> remote_hash;
};

struct UploadEntry {
    std::string remote_temp_path;
    std::uint64_t chunk_count = 0;
    std::uint64_t bytes_transferred = 0;
};

struct DecodeEntry {
    std::optional<bool> verified;
    std::optional<std::string> remote_hash;
};

/// Phase outputs keyed by content hash.
using CheckReport = std::unordered_map<std::string, CheckEntry>;
using UploadReport = std::unordered_map<std::string, UploadEntry>;
using DecodeReport = std::unordered_map<std::string, DecodeEntry>;

/**
 * @brief Insertion-ordered content hash -> TransferItem mapping
 *
 * Phases never modify a manifest in place; merged() returns a new snapshot
 * with the phase's results applied.
 */
class TransferManifest {
public:
    /**
     * Adds item unless its content hash is already present. On a collision the
     * first-seen item is kept, the new source is recorded as an alias and
     * false is returned.
     */
    bool insert(TransferItem item);

    [[nodiscard]] const TransferItem* find(const std::string& content_hash) const;
    [[nodiscard]] const std::vector<TransferItem>& items() const noexcept { return items_; }
    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

    [[nodiscard]] TransferManifest merged(const CheckReport& report) const;
    [[nodiscard]] TransferManifest merged(const UploadReport& report) const;
    [[nodiscard]] TransferManifest merged(const DecodeReport& report) const;

    [[nodiscard]] std::vector<const TransferItem*> dirty_items() const;

    /// Sum of encoded (base64) sizes of all dirty items.
    [[nodiscard]] std::uint64_t dirty_wire_bytes() const;

private:
    std::vector<TransferItem> items_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace rft::transfer
