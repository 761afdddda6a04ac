#include "rft/transfer/response_decoder.hpp"

#include <pugixml.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstring>

namespace rft::transfer {
namespace {

constexpr const char* kCommandTooLong = "The command line is too long";

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void append_utf8(std::string& out, unsigned int code_point) {
    if (code_point < 0x80) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
}

std::string trim_copy(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // namespace

const ResponseRecord* ResponseTable::find(const std::string& content_hash) const {
    const auto it = records.find(content_hash);
    return it == records.end() ? nullptr : &it->second;
}

Result<ResponseTable> ResponseDecoder::decode(const transport::CommandOutput& output) {
    auto status = classify(output);
    if (status.is_error()) {
        return Err<ResponseTable>(status.error());
    }
    return parse_records(output.stdout_text);
}

Result<void> ResponseDecoder::classify(const transport::CommandOutput& output) {
    if (output.stderr_text.find(kCommandTooLong) != std::string::npos) {
        spdlog::error("Remote side rejected command: {}", kCommandTooLong);
        return Err<void>(ErrorKind::CommandTooLong,
                         std::string(kCommandTooLong) + " (script or command exceeds the remote limit)");
    }

    const std::string pretty_stderr = unwrap_stderr(output.stderr_text);

    if (output.exit_code != 0) {
        std::string message = "Upload failed (exitcode: " + std::to_string(output.exit_code) + ")\n" + pretty_stderr;
        spdlog::error("{}", message);
        return Err<void>(Error(ErrorKind::RemoteScriptFailed, std::move(message), output.exit_code, pretty_stderr));
    }

    if (!is_blank(pretty_stderr)) {
        std::string message = "Upload failed (exitcode: 0), but stderr present\n" + pretty_stderr;
        spdlog::error("{}", message);
        return Err<void>(Error(ErrorKind::RemoteScriptFailed, std::move(message), 0, pretty_stderr));
    }

    return Ok();
}

Result<std::vector<std::vector<std::string>>> ResponseDecoder::parse_csv(const std::string& text) {
    using Rows = std::vector<std::vector<std::string>>;

    Rows rows;
    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;
    bool field_started = false;

    auto finish_row = [&]() {
        if (field_started || !field.empty() || !row.empty()) {
            row.push_back(std::move(field));
            rows.push_back(std::move(row));
        }
        row.clear();
        field.clear();
        field_started = false;
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        switch (c) {
            case '"':
                if (!field.empty()) {
                    return Err<Rows>(ErrorKind::RemoteScriptFailed,
                                     "Malformed CSV: quote inside unquoted field near offset " + std::to_string(i));
                }
                in_quotes = true;
                field_started = true;
                break;
            case ',':
                row.push_back(std::move(field));
                field.clear();
                field_started = true;
                break;
            case '\r':
                break;
            case '\n':
                finish_row();
                break;
            default:
                field.push_back(c);
                break;
        }
    }

    if (in_quotes) {
        return Err<Rows>(ErrorKind::RemoteScriptFailed, "Malformed CSV: unterminated quoted field");
    }
    finish_row();
    return Ok(std::move(rows));
}

Result<ResponseTable> ResponseDecoder::parse_records(const std::string& csv_text) {
    auto parsed = parse_csv(csv_text);
    if (parsed.is_error()) {
        return Err<ResponseTable>(parsed.error());
    }

    ResponseTable table;
    const auto& rows = parsed.value();
    if (rows.empty()) {
        return Ok(std::move(table));
    }

    const auto& header = rows.front();
    for (std::size_t r = 1; r < rows.size(); ++r) {
        const auto& row = rows[r];
        if (row.size() != header.size()) {
            return Err<ResponseTable>(ErrorKind::RemoteScriptFailed,
                                      "Malformed CSV: row " + std::to_string(r) + " has " +
                                      std::to_string(row.size()) + " fields, expected " +
                                      std::to_string(header.size()));
        }

        ResponseRecord record;
        for (std::size_t c = 0; c < header.size(); ++c) {
            if (row[c].empty()) {
                record[header[c]] = std::nullopt;
            } else {
                record[header[c]] = row[c];
            }
        }

        const auto key = record.find(kKeyColumn);
        if (key == record.end() || !key->second.has_value()) {
            return Err<ResponseTable>(ErrorKind::RemoteScriptFailed,
                                      std::string("Remote report row ") + std::to_string(r) +
                                      " has no " + kKeyColumn + " value");
        }

        const std::string content_hash = *key->second;
        if (table.records.find(content_hash) == table.records.end()) {
            table.order.push_back(content_hash);
        }
        table.records[content_hash] = std::move(record);
    }

    return Ok(std::move(table));
}

std::string ResponseDecoder::unwrap_stderr(const std::string& stderr_text) {
    const auto objs = stderr_text.find("<Objs");
    if (objs == std::string::npos) {
        return decode_escapes(stderr_text);
    }

    // Several <Objs> documents may follow the "#< CLIXML" marker
    pugi::xml_document doc;
    const pugi::xml_parse_result parsed = doc.load_buffer(stderr_text.data() + objs, stderr_text.size() - objs,
                                                          pugi::parse_default | pugi::parse_fragment);
    if (!parsed) {
        spdlog::warn("Could not parse CLIXML stderr ({}), returning it unparsed", parsed.description());
        return decode_escapes(stderr_text);
    }

    struct StringCollector : pugi::xml_tree_walker {
        std::string text;

        bool for_each(pugi::xml_node& node) override {
            if (node.type() == pugi::node_element && std::strcmp(node.name(), "S") == 0) {
                text += node.child_value();
            }
            return true;
        }
    };

    StringCollector collector;
    doc.traverse(collector);
    return decode_escapes(collector.text);
}

std::string ResponseDecoder::decode_escapes(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '_' && i + 6 < text.size() && text[i + 1] == 'x' && text[i + 6] == '_') {
            unsigned int code_point = 0;
            bool valid = true;
            for (std::size_t k = i + 2; k < i + 6; ++k) {
                const int digit = hex_value(text[k]);
                if (digit < 0) {
                    valid = false;
                    break;
                }
                code_point = code_point * 16 + static_cast<unsigned int>(digit);
            }
            if (valid) {
                append_utf8(out, code_point);
                i += 7;
                continue;
            }
        }
        out.push_back(text[i++]);
    }
    return out;
}

std::optional<bool> ResponseDecoder::parse_flag(const std::optional<std::string>& value) {
    if (!value) {
        return std::nullopt;
    }
    std::string lowered = trim_copy(*value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "true") {
        return true;
    }
    if (lowered == "false") {
        return false;
    }
    return std::nullopt;
}

} // namespace rft::transfer
