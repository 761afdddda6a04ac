#pragma once

#include "rft/config/transfer_config.hpp"
#include "rft/core/result.hpp"
#include "rft/transfer/id_generator.hpp"
#include "rft/transfer/literal_table.hpp"
#include "rft/transfer/manifest.hpp"
#include "rft/transfer/response_decoder.hpp"
#include "rft/transfer/scripts.hpp"
#include "rft/transfer/stream_encoder.hpp"
#include "rft/transport/command_executor.hpp"

#include <string>

namespace rft::transfer {

/**
 * @brief The check and decode exchanges with the remote scripts
 *
 * Each exchange serializes the manifest into a literal table, uploads it as a
 * hash-file through the stream encoder and runs one script against it. The
 * script's CSV output becomes an immutable phase report.
 */
class RemoteManifestProtocol {
public:
    RemoteManifestProtocol(transport::CommandExecutor& executor,
                           const config::TransferConfig& config,
                           const ScriptCatalog& scripts,
                           IdGenerator id_generator = default_id_generator());

    /// Existence/dirty state of every item. Fails if any item has no row.
    Result<CheckReport> check(const TransferManifest& manifest);

    /// Materializes dirty items and unpacks archives; no remote call when
    /// nothing needs decoding.
    Result<DecodeReport> decode(const TransferManifest& manifest);

    /// content_hash -> { target, src_basename, dst }
    [[nodiscard]] LiteralValue check_literal(const TransferManifest& manifest) const;

    /// tmpfile (or cleanN) -> { dst, tmpzip? } for dirty and archive items
    [[nodiscard]] LiteralValue decode_literal(const TransferManifest& manifest) const;

    /// Uploads a rendered literal to a fresh remote hash-file; returns its path.
    Result<std::string> create_remote_hash_file(const LiteralValue& literal);

private:
    Result<ResponseTable> run_script(const std::string& name, const std::string& hash_file);

    transport::CommandExecutor& executor_;
    const config::TransferConfig& config_;
    const ScriptCatalog& scripts_;
    IdGenerator id_generator_;
    ChunkedStreamEncoder encoder_;
};

} // namespace rft::transfer
