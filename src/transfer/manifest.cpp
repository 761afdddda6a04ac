#include "rft/transfer/manifest.hpp"

#include "rft/transfer/hashing.hpp"

namespace rft::transfer {

bool TransferManifest::insert(TransferItem item) {
    const auto it = index_.find(item.content_hash);
    if (it != index_.end()) {
        items_[it->second].aliases.push_back(item.source);
        return false;
    }
    index_.emplace(item.content_hash, items_.size());
    items_.push_back(std::move(item));
    return true;
}

const TransferItem* TransferManifest::find(const std::string& content_hash) const {
    const auto it = index_.find(content_hash);
    return it == index_.end() ? nullptr : &items_[it->second];
}

TransferManifest TransferManifest::merged(const CheckReport& report) const {
    TransferManifest next = *this;
    for (auto& item : next.items_) {
        const auto it = report.find(item.content_hash);
        if (it == report.end()) {
            continue;
        }
        item.remote_exists = it->second.remote_exists;
        item.dirty = it->second.dirty;
        item.verified = it->second.verified;
        item.remote_hash = it->second.remote_hash;
    }
    return next;
}

TransferManifest TransferManifest::merged(const UploadReport& report) const {
    TransferManifest next = *this;
    for (auto& item : next.items_) {
        const auto it = report.find(item.content_hash);
        if (it == report.end()) {
            continue;
        }
        item.remote_temp_path = it->second.remote_temp_path;
        item.chunk_count = it->second.chunk_count;
        item.bytes_transferred = it->second.bytes_transferred;
    }
    return next;
}

TransferManifest TransferManifest::merged(const DecodeReport& report) const {
    TransferManifest next = *this;
    for (auto& item : next.items_) {
        const auto it = report.find(item.content_hash);
        if (it == report.end()) {
            continue;
        }
        if (it->second.verified) {
            item.verified = it->second.verified;
        }
        if (it->second.remote_hash) {
            item.remote_hash = it->second.remote_hash;
        }
    }
    return next;
}

std::vector<const TransferItem*> TransferManifest::dirty_items() const {
    std::vector<const TransferItem*> dirty;
    for (const auto& item : items_) {
        if (item.is_dirty()) {
            dirty.push_back(&item);
        }
    }
    return dirty;
}

std::uint64_t TransferManifest::dirty_wire_bytes() const {
    std::uint64_t total = 0;
    for (const auto& item : items_) {
        if (item.is_dirty()) {
            total += base64_length(item.size);
        }
    }
    return total;
}

} // namespace rft::transfer
