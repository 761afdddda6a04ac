#include "rft/transfer/response_decoder.hpp"

#include <gtest/gtest.h>

using rft::ErrorKind;
using rft::transfer::ResponseDecoder;
using rft::transport::CommandOutput;

namespace {

const char* const kClixml =
    "#< CLIXML\r\n"
    "<Objs Version=\"1.1.0.1\" xmlns=\"http://schemas.microsoft.com/powershell/2004/04\">"
    "<S S=\"Error\">Oh noes_x000D__x000A_</S>"
    "<S S=\"Error\">At line:1 char:1 &amp; more_x000D__x000A_</S>"
    "</Objs>";

} // namespace

TEST(ResponseDecoderTest, ParsesQuotedCsvWithEscapes) {
    auto rows = ResponseDecoder::parse_csv("\"a\",\"b,c\",\"say \"\"hi\"\"\"\r\n\"1\",,\"x\"\r\n");
    ASSERT_TRUE(rows.is_ok()) << rows.error().message;
    ASSERT_EQ(rows.value().size(), 2u);
    EXPECT_EQ(rows.value()[0][1], "b,c");
    EXPECT_EQ(rows.value()[0][2], "say \"hi\"");
    EXPECT_EQ(rows.value()[1][1], "");
}

TEST(ResponseDecoderTest, UnterminatedQuoteIsAnError) {
    auto rows = ResponseDecoder::parse_csv("\"a\",\"b\r\n");
    ASSERT_TRUE(rows.is_error());
    EXPECT_EQ(rows.error().kind, ErrorKind::RemoteScriptFailed);
}

TEST(ResponseDecoderTest, RecordsAreKeyedByContentHashAndEmptyFieldsAreAbsent) {
    const std::string csv =
        "\"src_md5\",\"chk_exists\",\"dst_md5\",\"chk_dirty\",\"verifies\"\r\n"
        "\"aaa\",\"True\",\"aaa\",\"False\",\"True\"\r\n"
        "\"bbb\",\"False\",\"\",\"True\",\"False\"\r\n";

    auto table = ResponseDecoder::parse_records(csv);
    ASSERT_TRUE(table.is_ok()) << table.error().message;
    ASSERT_EQ(table.value().size(), 2u);
    EXPECT_EQ(table.value().order[0], "aaa");

    const auto* missing = table.value().find("bbb");
    ASSERT_NE(missing, nullptr);
    EXPECT_FALSE(missing->at("dst_md5").has_value());
    EXPECT_EQ(ResponseDecoder::parse_flag(missing->at("chk_dirty")), std::optional<bool>(true));
    EXPECT_EQ(table.value().find("ccc"), nullptr);
}

TEST(ResponseDecoderTest, RowWithoutContentHashIsMalformed) {
    auto table = ResponseDecoder::parse_records("\"src_md5\",\"dst\"\r\n\"\",\"C:\\x\"\r\n");
    ASSERT_TRUE(table.is_error());
    EXPECT_EQ(table.error().kind, ErrorKind::RemoteScriptFailed);
}

TEST(ResponseDecoderTest, RowWithWrongFieldCountIsMalformed) {
    auto table = ResponseDecoder::parse_records("\"src_md5\",\"dst\"\r\n\"aaa\"\r\n");
    ASSERT_TRUE(table.is_error());
}

TEST(ResponseDecoderTest, EmptyOutputHasNoRecords) {
    auto table = ResponseDecoder::parse_records("");
    ASSERT_TRUE(table.is_ok());
    EXPECT_EQ(table.value().size(), 0u);
}

TEST(ResponseDecoderTest, UnwrapsClixmlErrorStream) {
    const std::string text = ResponseDecoder::unwrap_stderr(kClixml);
    EXPECT_EQ(text, "Oh noes\r\nAt line:1 char:1 & more\r\n");
}

TEST(ResponseDecoderTest, UnwrapsLargeClixmlErrorStream) {
    const std::string body(200000, 'x');
    const std::string stderr_text = "#< CLIXML\r\n"
                                    "<Objs Version=\"1.1.0.1\" xmlns=\"http://schemas.microsoft.com/powershell/2004/04\">"
                                    "<S S=\"Error\">" + body + "_x000D__x000A_</S></Objs>";

    const std::string text = ResponseDecoder::unwrap_stderr(stderr_text);
    EXPECT_EQ(text, body + "\r\n");

    auto status = ResponseDecoder::classify(CommandOutput{"", stderr_text, 1});
    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.error().kind, ErrorKind::RemoteScriptFailed);
}

TEST(ResponseDecoderTest, MalformedClixmlFallsBackToRawText) {
    const std::string text = ResponseDecoder::unwrap_stderr("#< CLIXML\r\n<Objs><S S=\"Error\">cut off_x000A_");
    EXPECT_NE(text.find("cut off\n"), std::string::npos);
}

TEST(ResponseDecoderTest, PlainStderrIsKeptAsIs) {
    EXPECT_EQ(ResponseDecoder::unwrap_stderr("Access denied"), "Access denied");
    EXPECT_EQ(ResponseDecoder::decode_escapes("tab_x0009_end"), "tab\tend");
    EXPECT_EQ(ResponseDecoder::decode_escapes("_xZZZZ_"), "_xZZZZ_");
}

TEST(ResponseDecoderTest, NonZeroExitIsRemoteScriptFailure) {
    auto status = ResponseDecoder::classify(CommandOutput{"", "Oh noes\n", 10});
    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.error().kind, ErrorKind::RemoteScriptFailed);
    EXPECT_EQ(status.error().exit_code, 10);
    EXPECT_NE(status.error().message.find("exitcode: 10"), std::string::npos);
    EXPECT_NE(status.error().message.find("Oh noes"), std::string::npos);
}

TEST(ResponseDecoderTest, StderrOnSuccessfulExitIsStillAFailure) {
    auto status = ResponseDecoder::classify(CommandOutput{"\"src_md5\"\r\n", kClixml, 0});
    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.error().kind, ErrorKind::RemoteScriptFailed);
    EXPECT_NE(status.error().message.find("exitcode: 0"), std::string::npos);
    EXPECT_NE(status.error().stderr_text.find("Oh noes"), std::string::npos);
}

TEST(ResponseDecoderTest, CommandTooLongIsClassifiedSeparately) {
    auto status = ResponseDecoder::classify(CommandOutput{"", "The command line is too long.\r\n", 1});
    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.error().kind, ErrorKind::CommandTooLong);
}

TEST(ResponseDecoderTest, CleanOutputDecodesToRecords) {
    auto table = ResponseDecoder::decode(CommandOutput{"\"src_md5\",\"verifies\"\r\n\"aaa\",\"TRUE\"\r\n", "  \r\n", 0});
    ASSERT_TRUE(table.is_ok());
    EXPECT_EQ(ResponseDecoder::parse_flag(table.value().find("aaa")->at("verifies")), std::optional<bool>(true));
}

TEST(ResponseDecoderTest, FlagParsing) {
    EXPECT_EQ(ResponseDecoder::parse_flag(std::string("True")), std::optional<bool>(true));
    EXPECT_EQ(ResponseDecoder::parse_flag(std::string("false")), std::optional<bool>(false));
    EXPECT_EQ(ResponseDecoder::parse_flag(std::string("maybe")), std::nullopt);
    EXPECT_EQ(ResponseDecoder::parse_flag(std::nullopt), std::nullopt);
}
