#include "rft/transfer/manifest_protocol.hpp"
#include "support/fake_executor.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using rft::ErrorKind;
using rft::config::TransferConfig;
using rft::test_support::FakeExecutor;
using rft::transport::CommandOutput;
using namespace rft::transfer;

namespace {

const std::string kFileHash = "0123456789abcdef0123456789abcdef";
const std::string kDirHash = "fedcba9876543210fedcba9876543210";

IdGenerator counting_ids() {
    auto next = std::make_shared<int>(0);
    return [next] { return "id" + std::to_string((*next)++); };
}

TransferManifest sample_manifest() {
    TransferManifest manifest;

    TransferItem file;
    file.content_hash = kFileHash;
    file.source = "/src/app.config";
    file.destination = "C:\\app\\app.config";
    file.size = 12;
    manifest.insert(file);

    TransferItem dir;
    dir.content_hash = kDirHash;
    dir.source = "/src/assets";
    dir.archive_path = "/tmp/rft-upload-0.zip";
    dir.remote_archive_path = "$env:TEMP\\rft-upload\\tmpzip-" + kDirHash + ".zip";
    dir.destination = "C:\\app\\assets";
    dir.size = 300;
    manifest.insert(dir);

    return manifest;
}

class RemoteManifestProtocolTest : public ::testing::Test {
protected:
    FakeExecutor executor_;
    TransferConfig config_;
    ScriptCatalog scripts_;
    RemoteManifestProtocol protocol_{executor_, config_, scripts_, counting_ids()};
};

} // namespace

TEST_F(RemoteManifestProtocolTest, CheckLiteralTargetsArchiveForDirectories) {
    const LiteralValue literal = protocol_.check_literal(sample_manifest());
    ASSERT_EQ(literal.size(), 2u);

    const LiteralValue* file = literal.find(kFileHash);
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->find("target")->text(), "C:\\app\\app.config");
    EXPECT_EQ(file->find("src_basename")->text(), "app.config");
    EXPECT_EQ(file->find("dst")->text(), "C:\\app\\app.config");

    const LiteralValue* dir = literal.find(kDirHash);
    ASSERT_NE(dir, nullptr);
    EXPECT_EQ(dir->find("target")->text(), "$env:TEMP\\rft-upload\\tmpzip-" + kDirHash + ".zip");
    EXPECT_EQ(dir->find("src_basename")->text(), "assets");
}

TEST_F(RemoteManifestProtocolTest, CheckUploadsHashFileAndParsesReport) {
    executor_.remote_hashes["C:\\app\\app.config"] = kFileHash;

    auto report = protocol_.check(sample_manifest());
    ASSERT_TRUE(report.is_ok()) << report.error().message;

    // Hash-file goes through the chunked CMD path
    EXPECT_EQ(executor_.commands.front(), "echo|set /p=>\"%TEMP%\\hash-id0.txt\"");
    ASSERT_EQ(executor_.check_literals.size(), 1u);
    EXPECT_EQ(executor_.check_literals[0].size(), 2u);

    const auto& clean = report.value().at(kFileHash);
    EXPECT_EQ(clean.remote_exists, std::optional<bool>(true));
    EXPECT_EQ(clean.dirty, std::optional<bool>(false));
    EXPECT_EQ(clean.verified, std::optional<bool>(true));
    EXPECT_EQ(clean.remote_hash, std::optional<std::string>(kFileHash));

    const auto& fresh = report.value().at(kDirHash);
    EXPECT_EQ(fresh.remote_exists, std::optional<bool>(false));
    EXPECT_EQ(fresh.dirty, std::optional<bool>(true));
    EXPECT_FALSE(fresh.remote_hash.has_value());
}

TEST_F(RemoteManifestProtocolTest, CheckFailsWhenAnItemHasNoRow) {
    executor_.script_handler = [](const std::string&) -> std::optional<CommandOutput> {
        return CommandOutput{"\"src_md5\",\"chk_exists\",\"dst_md5\",\"chk_dirty\",\"verifies\"\r\n"
                             "\"" + kFileHash + "\",\"True\",\"" + kFileHash + "\",\"False\",\"True\"\r\n",
                             "", 0};
    };

    auto report = protocol_.check(sample_manifest());
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().kind, ErrorKind::RemoteScriptFailed);
    EXPECT_NE(report.error().message.find(kDirHash), std::string::npos);
}

TEST_F(RemoteManifestProtocolTest, CheckSurfacesScriptFailure) {
    executor_.check_failure = CommandOutput{"", "Oh noes\n", 10};

    auto report = protocol_.check(sample_manifest());
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().kind, ErrorKind::RemoteScriptFailed);
    EXPECT_EQ(report.error().exit_code, 10);
    EXPECT_NE(report.error().message.find("exitcode: 10"), std::string::npos);
    EXPECT_NE(report.error().message.find("Oh noes"), std::string::npos);
}

TEST_F(RemoteManifestProtocolTest, DecodeLiteralCoversDirtyItemsAndArchives) {
    TransferManifest manifest = sample_manifest();

    CheckReport check;
    check[kFileHash] = CheckEntry{false, true, false, std::nullopt};
    check[kDirHash] = CheckEntry{true, false, true, kDirHash};
    UploadReport upload;
    upload[kFileHash] = UploadEntry{"$env:TEMP\\b64-" + kFileHash + ".txt", 1, 16};
    manifest = manifest.merged(check).merged(upload);

    const LiteralValue literal = protocol_.decode_literal(manifest);
    ASSERT_EQ(literal.size(), 2u);
    EXPECT_EQ(literal.keys()[0], "$env:TEMP\\b64-" + kFileHash + ".txt");
    EXPECT_EQ(literal.values()[0].find("dst")->text(), "C:\\app\\app.config");
    EXPECT_EQ(literal.values()[0].find("tmpzip"), nullptr);

    EXPECT_EQ(literal.keys()[1], "clean1");
    EXPECT_EQ(literal.values()[1].find("tmpzip")->text(), "$env:TEMP\\rft-upload\\tmpzip-" + kDirHash + ".zip");
}

TEST_F(RemoteManifestProtocolTest, DecodeIsSkippedWhenNothingToDo) {
    TransferManifest manifest;
    TransferItem file;
    file.content_hash = kFileHash;
    file.source = "/src/app.config";
    file.destination = "C:\\app\\app.config";
    file.dirty = false;
    manifest.insert(file);

    auto report = protocol_.decode(manifest);
    ASSERT_TRUE(report.is_ok());
    EXPECT_TRUE(report.value().empty());
    EXPECT_EQ(executor_.total_remote_calls(), 0u);
}

TEST_F(RemoteManifestProtocolTest, DecodeReportsVerification) {
    TransferManifest manifest = sample_manifest();
    CheckReport check;
    check[kFileHash] = CheckEntry{false, true, false, std::nullopt};
    check[kDirHash] = CheckEntry{false, true, false, std::nullopt};
    manifest = manifest.merged(check);

    UploadReport upload;
    upload[kFileHash] = UploadEntry{"$env:TEMP\\b64-" + kFileHash + ".txt", 1, 16};
    upload[kDirHash] = UploadEntry{"$env:TEMP\\b64-" + kDirHash + ".txt", 1, 400};
    manifest = manifest.merged(upload);
    executor_.unverified.insert("C:\\app\\assets");

    auto report = protocol_.decode(manifest);
    ASSERT_TRUE(report.is_ok()) << report.error().message;
    EXPECT_EQ(executor_.decode_calls, 1);
    EXPECT_EQ(report.value().at(kFileHash).verified, std::optional<bool>(true));
    EXPECT_EQ(report.value().at(kDirHash).verified, std::optional<bool>(false));

    ASSERT_EQ(executor_.decode_literals.size(), 1u);
    EXPECT_EQ(executor_.decode_literals[0][1].fields.at("tmpzip"),
              "$env:TEMP\\rft-upload\\tmpzip-" + kDirHash + ".zip");
}
