#pragma once

#include "rft/core/result.hpp"
#include "rft/transport/command_executor.hpp"

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rft::transfer {

/// One CSV row: column name -> value; empty fields are absent (std::nullopt).
using ResponseRecord = std::map<std::string, std::optional<std::string>>;

/// Records indexed by their content-hash column, in row order.
struct ResponseTable {
    std::vector<std::string> order;
    std::unordered_map<std::string, ResponseRecord> records;

    [[nodiscard]] const ResponseRecord* find(const std::string& content_hash) const;
    [[nodiscard]] std::size_t size() const noexcept { return order.size(); }
};

/**
 * @brief Turns remote script output into records, or into an Error
 *
 * Remote scripts print a CSV document (ConvertTo-Csv -NoTypeInformation) with
 * one row per manifest entry. PowerShell serializes its error stream as
 * CLIXML, which is unwrapped to plain text before it is shown to anyone.
 */
class ResponseDecoder {
public:
    static constexpr const char* kKeyColumn = "src_md5";

    /// Parses stdout after classify() accepted the output.
    static Result<ResponseTable> decode(const transport::CommandOutput& output);

    /**
     * Fails with CommandTooLong, or RemoteScriptFailed when the exit code is
     * non-zero or stderr carries any text.
     */
    static Result<void> classify(const transport::CommandOutput& output);

    /// RFC 4180 CSV with a header row; returns header + rows.
    static Result<std::vector<std::vector<std::string>>> parse_csv(const std::string& text);

    static Result<ResponseTable> parse_records(const std::string& csv_text);

    /// Extracts text from a CLIXML error stream and decodes _xHHHH_ escapes.
    static std::string unwrap_stderr(const std::string& stderr_text);

    static std::string decode_escapes(const std::string& text);

    /// "True"/"False" (any case) to a flag; anything else is unknown.
    static std::optional<bool> parse_flag(const std::optional<std::string>& value);
};

} // namespace rft::transfer
