#pragma once

#include "rft/config/transfer_config.hpp"
#include "rft/core/result.hpp"
#include "rft/transport/command_executor.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <string>

namespace rft::transfer {

struct StreamUploadResult {
    std::uint64_t chunk_count = 0;
    std::uint64_t bytes_transferred = 0; ///< Encoded (wire) bytes
};

/// Called after every chunk with the cumulative encoded byte count.
using ChunkProgress = std::function<void(std::uint64_t bytes_so_far)>;

/**
 * @brief Writes a byte stream to a remote text file as base64, one CMD
 *        command per chunk
 *
 * The destination is truncated first, then each block is appended with
 * `echo <base64> >> "<dest>"`. Blocks are sized so that no command exceeds
 * TransferConfig::max_command_length including the destination path.
 */
class ChunkedStreamEncoder {
public:
    ChunkedStreamEncoder(transport::CommandExecutor& executor, const config::TransferConfig& config);

    Result<StreamUploadResult> upload(std::istream& input,
                                      const std::string& destination,
                                      const ChunkProgress& progress = {}) const;

    Result<StreamUploadResult> upload_file(const std::filesystem::path& source,
                                           const std::string& destination,
                                           const ChunkProgress& progress = {}) const;

    /// Encoded characters one append command may carry for this destination.
    [[nodiscard]] Result<std::size_t> chunk_budget(const std::string& destination) const;

    /// Destination spelled for CMD (PowerShell temp prefix replaced).
    [[nodiscard]] std::string to_cmd_path(const std::string& destination) const;

    static std::string truncate_command(const std::string& cmd_destination);
    static std::string append_command(const std::string& encoded, const std::string& cmd_destination);

private:
    Result<void> run(const std::string& command) const;

    transport::CommandExecutor& executor_;
    const config::TransferConfig& config_;
};

} // namespace rft::transfer
