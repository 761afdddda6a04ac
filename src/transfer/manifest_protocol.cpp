#include "rft/transfer/manifest_protocol.hpp"

#include "rft/transfer/manifest_builder.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace rft::transfer {

RemoteManifestProtocol::RemoteManifestProtocol(transport::CommandExecutor& executor,
                                               const config::TransferConfig& config,
                                               const ScriptCatalog& scripts,
                                               IdGenerator id_generator)
    : executor_(executor),
      config_(config),
      scripts_(scripts),
      id_generator_(std::move(id_generator)),
      encoder_(executor, config) {}

LiteralValue RemoteManifestProtocol::check_literal(const TransferManifest& manifest) const {
    LiteralValue literal;
    for (const auto& item : manifest.items()) {
        LiteralValue entry;
        entry.add("target", item.remote_archive_path.value_or(item.destination));
        entry.add("src_basename", ContentManifestBuilder::source_basename(item.source));
        entry.add("dst", item.destination);
        literal.add(item.content_hash, std::move(entry));
    }
    return literal;
}

LiteralValue RemoteManifestProtocol::decode_literal(const TransferManifest& manifest) const {
    LiteralValue literal;
    std::size_t clean = 0;
    for (const auto& item : manifest.items()) {
        if (!item.is_dirty() && !item.is_archive()) {
            continue;
        }

        LiteralValue entry;
        entry.add("dst", item.destination);
        if (item.remote_archive_path) {
            entry.add("tmpzip", *item.remote_archive_path);
        }

        // A clean archive was uploaded by an earlier call; it only needs unpacking
        std::string key = item.remote_temp_path ? *item.remote_temp_path : "clean" + std::to_string(++clean);
        literal.add(std::move(key), std::move(entry));
    }
    return literal;
}

Result<std::string> RemoteManifestProtocol::create_remote_hash_file(const LiteralValue& literal) {
    const std::string hash_file = config_.remote_join(config_.remote_temp_dir, "hash-" + id_generator_() + ".txt");
    const std::string rendered = render_literal(literal);

    std::istringstream lines(rendered);
    for (std::string line; std::getline(lines, line);) {
        spdlog::debug("{}", line);
    }

    std::istringstream input(rendered);
    auto uploaded = encoder_.upload(input, hash_file);
    if (uploaded.is_error()) {
        return Err<std::string>(uploaded.error());
    }
    return Ok(hash_file);
}

Result<ResponseTable> RemoteManifestProtocol::run_script(const std::string& name, const std::string& hash_file) {
    auto script = scripts_.render(name, {{"hash_file", hash_file}});
    if (script.is_error()) {
        return Err<ResponseTable>(script.error());
    }

    spdlog::debug("Running {}.ps1", name);
    auto output = executor_.run_powershell_script(script.value());
    if (output.is_error()) {
        return Err<ResponseTable>(output.error());
    }
    return ResponseDecoder::decode(output.value());
}

Result<CheckReport> RemoteManifestProtocol::check(const TransferManifest& manifest) {
    auto hash_file = create_remote_hash_file(check_literal(manifest));
    if (hash_file.is_error()) {
        return Err<CheckReport>(hash_file.error());
    }

    auto table = run_script("check_files", hash_file.value());
    if (table.is_error()) {
        return Err<CheckReport>(table.error());
    }

    CheckReport report;
    for (const auto& item : manifest.items()) {
        const ResponseRecord* record = table.value().find(item.content_hash);
        if (record == nullptr) {
            spdlog::error("check_files returned no row for {} ({})", item.source.string(), item.content_hash);
            return Err<CheckReport>(ErrorKind::RemoteScriptFailed,
                                    "Remote check report has no entry for " + item.content_hash +
                                    " (" + item.source.string() + ")");
        }

        auto field = [record](const char* column) -> std::optional<std::string> {
            const auto it = record->find(column);
            return it == record->end() ? std::nullopt : it->second;
        };

        CheckEntry entry;
        entry.remote_exists = ResponseDecoder::parse_flag(field("chk_exists"));
        entry.dirty = ResponseDecoder::parse_flag(field("chk_dirty"));
        entry.verified = ResponseDecoder::parse_flag(field("verifies"));
        entry.remote_hash = field("dst_md5");
        report.emplace(item.content_hash, std::move(entry));
    }
    return Ok(std::move(report));
}

Result<DecodeReport> RemoteManifestProtocol::decode(const TransferManifest& manifest) {
    const LiteralValue literal = decode_literal(manifest);
    if (literal.empty()) {
        spdlog::debug("No remote files to decode, skipping");
        return Ok(DecodeReport{});
    }

    auto hash_file = create_remote_hash_file(literal);
    if (hash_file.is_error()) {
        return Err<DecodeReport>(hash_file.error());
    }

    auto table = run_script("decode_files", hash_file.value());
    if (table.is_error()) {
        return Err<DecodeReport>(table.error());
    }

    DecodeReport report;
    for (const auto& content_hash : table.value().order) {
        const ResponseRecord& record = table.value().records.at(content_hash);
        DecodeEntry entry;
        if (const auto it = record.find("verifies"); it != record.end()) {
            entry.verified = ResponseDecoder::parse_flag(it->second);
        }
        if (const auto it = record.find("dst_md5"); it != record.end()) {
            entry.remote_hash = it->second;
        }
        report.emplace(content_hash, std::move(entry));
    }
    return Ok(std::move(report));
}

} // namespace rft::transfer
