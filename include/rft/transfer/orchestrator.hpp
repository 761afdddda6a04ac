#pragma once

#include "rft/config/transfer_config.hpp"
#include "rft/core/result.hpp"
#include "rft/events/event_bus.hpp"
#include "rft/transfer/directory_packager.hpp"
#include "rft/transfer/id_generator.hpp"
#include "rft/transfer/manifest.hpp"
#include "rft/transfer/manifest_builder.hpp"
#include "rft/transfer/report.hpp"
#include "rft/transfer/scripts.hpp"
#include "rft/transfer/stream_encoder.hpp"
#include "rft/transport/command_executor.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace rft::transfer {

struct UploadResult {
    std::uint64_t total_bytes = 0; ///< Encoded bytes of every dirty payload
    TransferReport report;
};

/**
 * Called once per chunk. bytes_so_far counts the current payload and starts
 * over for each item; total_bytes is UploadResult::total_bytes.
 */
using ProgressCallback = std::function<void(std::uint64_t bytes_so_far,
                                            std::uint64_t total_bytes,
                                            const std::filesystem::path& source,
                                            const std::string& destination)>;

/**
 * @brief Runs one batched upload: build, check, stream, decode
 *
 * PHASES (strictly sequential, one executor session):
 * 1. Hash every source into a manifest. Missing sources fail here, before
 *    the session is opened.
 * 2. dirty_check: one remote script call decides which items must be sent.
 * 3. stream_files: every dirty payload is written to its remote tmpfile in
 *    base64 chunks. Clean items cost nothing.
 * 4. decode: one remote script call turns tmpfiles into destinations and
 *    unpacks archives. Skipped when there is nothing to decode.
 *
 * Any error aborts the whole call. The session is closed and local scratch
 * archives are deleted on every exit path.
 *
 * Events go to the optional EventBus; the orchestrator works the same
 * without one.
 */
class TransferOrchestrator {
public:
    TransferOrchestrator(transport::CommandExecutor& executor,
                         const config::TransferConfig& config,
                         const ScriptCatalog& scripts,
                         DirectoryPackager& packager,
                         events::EventBus* bus = nullptr,
                         IdGenerator id_generator = default_id_generator());

    Result<UploadResult> upload(const std::vector<std::filesystem::path>& local_paths,
                                const std::string& remote_destination,
                                const ProgressCallback& progress = {});

    Result<UploadResult> upload(const std::filesystem::path& local_path,
                                const std::string& remote_destination,
                                const ProgressCallback& progress = {});

private:
    Result<UploadResult> run_upload(const std::vector<std::filesystem::path>& local_paths,
                                    const std::string& remote_destination,
                                    const ProgressCallback& progress);

    Result<UploadReport> stream_files(const TransferManifest& manifest,
                                      std::uint64_t total_bytes,
                                      const ProgressCallback& progress);

    template<typename EventType>
    void publish(const EventType& event) {
        if (bus_ != nullptr) {
            bus_->emit(event);
        }
    }

    transport::CommandExecutor& executor_;
    const config::TransferConfig& config_;
    const ScriptCatalog& scripts_;
    events::EventBus* bus_;
    IdGenerator id_generator_;
    ContentManifestBuilder builder_;
    ChunkedStreamEncoder encoder_;
};

} // namespace rft::transfer
