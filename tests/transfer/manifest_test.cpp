#include "rft/transfer/manifest.hpp"

#include <gtest/gtest.h>

using namespace rft::transfer;

namespace {

TransferItem make_item(const std::string& hash, const std::string& source, std::uint64_t size) {
    TransferItem item;
    item.content_hash = hash;
    item.source = source;
    item.destination = "C:\\dest\\" + std::filesystem::path(source).filename().string();
    item.size = size;
    return item;
}

} // namespace

TEST(TransferManifestTest, DuplicateContentKeepsFirstAndRecordsAlias) {
    TransferManifest manifest;
    EXPECT_TRUE(manifest.insert(make_item("aaa", "/src/one.txt", 10)));
    EXPECT_FALSE(manifest.insert(make_item("aaa", "/other/copy.txt", 10)));
    EXPECT_TRUE(manifest.insert(make_item("bbb", "/src/two.txt", 20)));

    ASSERT_EQ(manifest.size(), 2u);
    const auto* kept = manifest.find("aaa");
    ASSERT_NE(kept, nullptr);
    EXPECT_EQ(kept->source, std::filesystem::path("/src/one.txt"));
    EXPECT_EQ(kept->destination, "C:\\dest\\one.txt");
    ASSERT_EQ(kept->aliases.size(), 1u);
    EXPECT_EQ(kept->aliases[0], std::filesystem::path("/other/copy.txt"));
    EXPECT_EQ(manifest.items()[1].content_hash, "bbb");
}

TEST(TransferManifestTest, MergeReturnsNewSnapshot) {
    TransferManifest manifest;
    manifest.insert(make_item("aaa", "/src/one.txt", 10));
    manifest.insert(make_item("bbb", "/src/two.txt", 20));

    CheckReport check;
    check["aaa"] = CheckEntry{true, false, true, std::string("aaa")};
    check["bbb"] = CheckEntry{false, true, false, std::nullopt};

    const TransferManifest checked = manifest.merged(check);

    EXPECT_FALSE(manifest.find("bbb")->dirty.has_value());
    EXPECT_FALSE(checked.find("aaa")->is_dirty());
    EXPECT_TRUE(checked.find("bbb")->is_dirty());
    EXPECT_EQ(checked.find("aaa")->remote_hash, std::optional<std::string>("aaa"));

    UploadReport upload;
    upload["bbb"] = UploadEntry{"$env:TEMP\\b64-bbb.txt", 1, 28};
    const TransferManifest uploaded = checked.merged(upload);
    EXPECT_FALSE(checked.find("bbb")->remote_temp_path.has_value());
    EXPECT_EQ(uploaded.find("bbb")->remote_temp_path, std::optional<std::string>("$env:TEMP\\b64-bbb.txt"));
    EXPECT_EQ(uploaded.find("bbb")->bytes_transferred, std::optional<std::uint64_t>(28));
    EXPECT_FALSE(uploaded.find("aaa")->chunk_count.has_value());

    DecodeReport decode;
    decode["bbb"] = DecodeEntry{true, std::string("bbb")};
    const TransferManifest decoded = uploaded.merged(decode);
    EXPECT_EQ(decoded.find("bbb")->verified, std::optional<bool>(true));
    EXPECT_EQ(decoded.find("bbb")->remote_hash, std::optional<std::string>("bbb"));
    EXPECT_EQ(decoded.find("aaa")->verified, std::optional<bool>(true));
}

TEST(TransferManifestTest, DirtyWireBytesCountsOnlyDirtyItems) {
    TransferManifest manifest;
    manifest.insert(make_item("aaa", "/src/one.txt", 10));
    manifest.insert(make_item("bbb", "/src/two.txt", 20));
    manifest.insert(make_item("ccc", "/src/three.txt", 0));

    CheckReport check;
    check["aaa"] = CheckEntry{true, false, true, std::string("aaa")};
    check["bbb"] = CheckEntry{true, true, false, std::string("zzz")};
    check["ccc"] = CheckEntry{false, true, false, std::nullopt};

    const auto checked = manifest.merged(check);
    EXPECT_EQ(checked.dirty_wire_bytes(), 28u);

    const auto dirty = checked.dirty_items();
    ASSERT_EQ(dirty.size(), 2u);
    EXPECT_EQ(dirty[0]->content_hash, "bbb");
    EXPECT_EQ(dirty[1]->content_hash, "ccc");
}

TEST(TransferItemTest, PayloadIsArchiveForDirectories) {
    TransferItem file = make_item("aaa", "/src/one.txt", 1);
    EXPECT_FALSE(file.is_archive());
    EXPECT_EQ(file.payload_path(), std::filesystem::path("/src/one.txt"));

    TransferItem directory = make_item("bbb", "/src/tree", 1);
    directory.archive_path = "/tmp/rft-upload-1.zip";
    EXPECT_TRUE(directory.is_archive());
    EXPECT_EQ(directory.payload_path(), std::filesystem::path("/tmp/rft-upload-1.zip"));
}
