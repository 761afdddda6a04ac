#include "rft/transfer/report.hpp"

#include <algorithm>

namespace rft::transfer {
using json = nlohmann::json;

namespace {

ItemReport make_item_report(const TransferItem& item) {
    ItemReport report;
    report.src = item.source.string();
    report.dst = item.destination;
    if (item.archive_path) {
        report.src_zip = item.archive_path->string();
    }
    report.tmpzip = item.remote_archive_path;
    report.src_hash = item.content_hash;
    report.dst_hash = item.remote_hash;
    report.exists = item.remote_exists;
    report.dirty = item.is_dirty();
    report.verified = item.verified;
    for (const auto& alias : item.aliases) {
        report.aliases.push_back(alias.string());
    }

    if (report.dirty) {
        report.tmpfile = item.remote_temp_path;
        report.size = item.size;
        report.bytes_transferred = item.bytes_transferred;
        report.chunks = item.chunk_count;
    }
    return report;
}

template<typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

} // namespace

TransferReport::TransferReport(const TransferManifest& manifest) {
    items_.reserve(manifest.size());
    for (const auto& item : manifest.items()) {
        items_.push_back(make_item_report(item));
    }
}

const ItemReport* TransferReport::find(const std::string& content_hash) const {
    const auto it = std::find_if(items_.begin(), items_.end(),
                                 [&](const ItemReport& item) { return item.src_hash == content_hash; });
    return it == items_.end() ? nullptr : &*it;
}

std::size_t TransferReport::uploaded_count() const {
    return static_cast<std::size_t>(
        std::count_if(items_.begin(), items_.end(), [](const ItemReport& item) { return item.dirty; }));
}

json to_json(const ItemReport& item) {
    json j;
    j["src"] = item.src;
    j["dst"] = item.dst;
    j["src_hash"] = item.src_hash;
    j["dirty"] = item.dirty;
    put_optional(j, "src_zip", item.src_zip);
    put_optional(j, "tmpfile", item.tmpfile);
    put_optional(j, "tmpzip", item.tmpzip);
    put_optional(j, "dst_hash", item.dst_hash);
    put_optional(j, "exists", item.exists);
    put_optional(j, "verified", item.verified);
    put_optional(j, "size", item.size);
    put_optional(j, "bytes_transferred", item.bytes_transferred);
    put_optional(j, "chunks", item.chunks);
    if (!item.aliases.empty()) {
        j["aliases"] = item.aliases;
    }
    return j;
}

json to_json(const TransferReport& report) {
    json j = json::object();
    for (const auto& item : report.items()) {
        j[item.src_hash] = to_json(item);
    }
    return j;
}

} // namespace rft::transfer
