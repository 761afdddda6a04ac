#pragma once

#include "rft/transfer/manifest.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rft::transfer {

/**
 * @brief What happened to one manifest item
 *
 * Items that were already current on the remote side carry only identity and
 * verification fields; tmpfile, size, bytes_transferred and chunks are set
 * for items that were actually sent.
 */
struct ItemReport {
    std::string src;
    std::string dst;
    std::optional<std::string> src_zip;
    std::optional<std::string> tmpfile;
    std::optional<std::string> tmpzip;
    std::string src_hash;
    std::optional<std::string> dst_hash;
    std::optional<bool> exists;
    bool dirty = false;
    std::optional<bool> verified;
    std::optional<std::uint64_t> size;
    std::optional<std::uint64_t> bytes_transferred;
    std::optional<std::uint64_t> chunks;
    std::vector<std::string> aliases;
};

/**
 * @brief Per-item outcome of one upload call, in manifest order
 */
class TransferReport {
public:
    TransferReport() = default;
    explicit TransferReport(const TransferManifest& manifest);

    [[nodiscard]] const ItemReport* find(const std::string& content_hash) const;
    [[nodiscard]] const std::vector<ItemReport>& items() const noexcept { return items_; }
    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }

    /// Items that were sent during this call.
    [[nodiscard]] std::size_t uploaded_count() const;

private:
    std::vector<ItemReport> items_;
};

nlohmann::json to_json(const ItemReport& item);

/// Object keyed by content hash.
nlohmann::json to_json(const TransferReport& report);

} // namespace rft::transfer
