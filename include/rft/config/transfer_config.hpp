#pragma once

#include "rft/core/result.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <filesystem>
#include <string>

namespace rft::config {

/**
 * @brief Tunables shared by the transfer engine and the file manager
 *
 * Remote paths use PowerShell syntax ($env:TEMP); remote_cmd_temp_dir is the
 * CMD spelling of the same location and is substituted whenever a path is
 * used inside a CMD command.
 */
struct TransferConfig {
    std::size_t max_command_length = 8000;
    std::string remote_temp_dir = "$env:TEMP";
    std::string remote_cmd_temp_dir = "%TEMP%";
    std::string upload_dir_name = "rft-upload";
    std::string remote_path_separator = "\\";
    std::filesystem::path local_temp_dir;       ///< Empty means the system temp directory
    std::filesystem::path script_prelude_dir;   ///< Optional directory of <script>.ps1 preludes
    std::string log_level = "info";

    [[nodiscard]] std::filesystem::path effective_local_temp_dir() const;

    /// Remote directory holding decoded archives before they are unpacked
    [[nodiscard]] std::string remote_upload_dir() const;

    /// root + separator + name, ignoring trailing separators on root.
    [[nodiscard]] std::string remote_join(const std::string& root, const std::string& name) const;
};

Result<TransferConfig> config_from_json(const nlohmann::json& document);

Result<TransferConfig> load_config(const std::filesystem::path& path);

nlohmann::json config_to_json(const TransferConfig& config);

/// Applies log_level to the default spdlog logger.
Result<void> configure_logging(const TransferConfig& config);

} // namespace rft::config
