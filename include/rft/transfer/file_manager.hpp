#pragma once

#include "rft/config/transfer_config.hpp"
#include "rft/core/result.hpp"
#include "rft/events/event_bus.hpp"
#include "rft/transfer/directory_packager.hpp"
#include "rft/transfer/orchestrator.hpp"
#include "rft/transfer/scripts.hpp"
#include "rft/transport/command_executor.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rft::transfer {

/**
 * @brief Everyday remote file operations over one CommandExecutor
 *
 * Every operation opens and closes its own session. Operations that report
 * a bool return false when the remote script exits non-zero; only transport
 * and local I/O problems are errors.
 *
 * Scripts come from config.script_prelude_dir when it holds a matching
 * <script>.ps1, otherwise from ScriptCatalog's built-in functions.
 */
class FileManager {
public:
    FileManager(transport::CommandExecutor& executor,
                const config::TransferConfig& config,
                events::EventBus* bus = nullptr);

    Result<UploadResult> upload(const std::vector<std::filesystem::path>& local_paths,
                                const std::string& remote_path,
                                const ProgressCallback& progress = {});

    Result<UploadResult> upload(const std::filesystem::path& local_path,
                                const std::string& remote_path,
                                const ProgressCallback& progress = {});

    /// MD5 hex of a remote file; empty when the file does not exist.
    Result<std::string> checksum(const std::string& remote_path);

    Result<bool> exists(const std::string& remote_path);
    Result<bool> create_dir(const std::string& remote_path);
    Result<bool> remove(const std::string& remote_path);

    /// Copies a remote file to local_path. false when the remote file is missing.
    Result<bool> download(const std::string& remote_path, const std::filesystem::path& local_path);

    /// Remote %TEMP% with '/' separators; queried once and cached.
    Result<std::string> temp_dir();

    ScriptCatalog& scripts() noexcept { return scripts_; }

private:
    Result<transport::CommandOutput> run_script(const std::string& name, const std::string& remote_path);
    Result<bool> run_status_script(const std::string& name, const std::string& remote_path);

    transport::CommandExecutor& executor_;
    const config::TransferConfig& config_;
    events::EventBus* bus_;
    ScriptCatalog scripts_;
    ZipDirectoryPackager packager_;
    std::optional<std::string> temp_dir_;
};

} // namespace rft::transfer
