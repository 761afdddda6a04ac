#include "rft/transfer/file_manager.hpp"

#include "rft/transfer/hashing.hpp"
#include "rft/transfer/response_decoder.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace rft::transfer {
namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

FileManager::FileManager(transport::CommandExecutor& executor,
                         const config::TransferConfig& config,
                         events::EventBus* bus)
    : executor_(executor),
      config_(config),
      bus_(bus),
      scripts_(config.script_prelude_dir),
      packager_(config.effective_local_temp_dir()) {}

Result<UploadResult> FileManager::upload(const std::vector<fs::path>& local_paths,
                                         const std::string& remote_path,
                                         const ProgressCallback& progress) {
    spdlog::debug("uploading: {} item(s) -> {}", local_paths.size(), remote_path);
    TransferOrchestrator orchestrator(executor_, config_, scripts_, packager_, bus_);
    return orchestrator.upload(local_paths, remote_path, progress);
}

Result<UploadResult> FileManager::upload(const fs::path& local_path,
                                         const std::string& remote_path,
                                         const ProgressCallback& progress) {
    return upload(std::vector<fs::path>{local_path}, remote_path, progress);
}

Result<transport::CommandOutput> FileManager::run_script(const std::string& name, const std::string& remote_path) {
    auto script = scripts_.render(name, {{"path", remote_path}});
    if (script.is_error()) {
        return Err<transport::CommandOutput>(script.error());
    }

    transport::ExecutorSession session(executor_);
    if (auto opened = session.open(); opened.is_error()) {
        return Err<transport::CommandOutput>(opened.error());
    }
    return executor_.run_powershell_script(script.value());
}

Result<bool> FileManager::run_status_script(const std::string& name, const std::string& remote_path) {
    auto output = run_script(name, remote_path);
    if (output.is_error()) {
        return Err<bool>(output.error());
    }
    return Ok(output.value().exit_code == 0);
}

Result<std::string> FileManager::checksum(const std::string& remote_path) {
    spdlog::debug("checksum: {}", remote_path);
    auto output = run_script("checksum", remote_path);
    if (output.is_error()) {
        return Err<std::string>(output.error());
    }
    if (auto status = ResponseDecoder::classify(output.value()); status.is_error()) {
        return Err<std::string>(status.error());
    }
    return Ok(trim(output.value().stdout_text));
}

Result<bool> FileManager::exists(const std::string& remote_path) {
    spdlog::debug("exists?: {}", remote_path);
    return run_status_script("exists", remote_path);
}

Result<bool> FileManager::create_dir(const std::string& remote_path) {
    spdlog::debug("create_dir: {}", remote_path);
    return run_status_script("create_dir", remote_path);
}

Result<bool> FileManager::remove(const std::string& remote_path) {
    spdlog::debug("deleting: {}", remote_path);
    return run_status_script("delete", remote_path);
}

Result<bool> FileManager::download(const std::string& remote_path, const fs::path& local_path) {
    spdlog::debug("downloading: {} -> {}", remote_path, local_path.string());
    auto output = run_script("download", remote_path);
    if (output.is_error()) {
        return Err<bool>(output.error());
    }
    if (output.value().exit_code != 0) {
        return Ok(false);
    }

    auto contents = base64_decode(output.value().stdout_text);
    if (contents.is_error()) {
        return Err<bool>(ErrorKind::RemoteScriptFailed,
                         "Download of " + remote_path + " returned invalid base64: " + contents.error().message);
    }

    std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Err<bool>(ErrorKind::LocalIo, "Failed to open " + local_path.string() + " for writing");
    }
    const auto& bytes = contents.value();
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        return Err<bool>(ErrorKind::LocalIo, "Failed to write " + local_path.string());
    }
    return Ok(true);
}

Result<std::string> FileManager::temp_dir() {
    if (temp_dir_) {
        return Ok(*temp_dir_);
    }

    transport::ExecutorSession session(executor_);
    if (auto opened = session.open(); opened.is_error()) {
        return Err<std::string>(opened.error());
    }

    auto output = executor_.run_cmd("echo %TEMP%");
    if (output.is_error()) {
        return Err<std::string>(output.error());
    }
    if (auto status = ResponseDecoder::classify(output.value()); status.is_error()) {
        return Err<std::string>(status.error());
    }

    std::string dir = trim(output.value().stdout_text);
    std::replace(dir.begin(), dir.end(), '\\', '/');
    temp_dir_ = dir;
    return Ok(std::move(dir));
}

} // namespace rft::transfer
