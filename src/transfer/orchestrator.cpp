#include "rft/transfer/orchestrator.hpp"

#include "rft/events/events.hpp"
#include "rft/transfer/manifest_protocol.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <iomanip>
#include <sstream>

namespace rft::transfer {
namespace fs = std::filesystem;

namespace {

using Clock = std::chrono::steady_clock;

// (1m2.35s)
std::string format_duration(Clock::duration elapsed) {
    const double total = std::chrono::duration<double>(elapsed).count();
    const auto minutes = static_cast<long>(total / 60.0);

    std::ostringstream oss;
    oss << '(' << minutes << 'm' << std::fixed << std::setprecision(2) << (total - minutes * 60.0) << "s)";
    return oss.str();
}

std::chrono::milliseconds to_millis(Clock::duration elapsed) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);
}

} // namespace

TransferOrchestrator::TransferOrchestrator(transport::CommandExecutor& executor,
                                           const config::TransferConfig& config,
                                           const ScriptCatalog& scripts,
                                           DirectoryPackager& packager,
                                           events::EventBus* bus,
                                           IdGenerator id_generator)
    : executor_(executor),
      config_(config),
      scripts_(scripts),
      bus_(bus),
      id_generator_(std::move(id_generator)),
      builder_(config, packager),
      encoder_(executor, config) {}

Result<UploadResult> TransferOrchestrator::upload(const fs::path& local_path,
                                                  const std::string& remote_destination,
                                                  const ProgressCallback& progress) {
    return upload(std::vector<fs::path>{local_path}, remote_destination, progress);
}

Result<UploadResult> TransferOrchestrator::upload(const std::vector<fs::path>& local_paths,
                                                  const std::string& remote_destination,
                                                  const ProgressCallback& progress) {
    const auto started = Clock::now();

    auto result = run_upload(local_paths, remote_destination, progress);
    if (result.is_error()) {
        publish(events::TransferFailedEvent{result.error().kind, result.error().message});
        return result;
    }

    publish(events::TransferCompletedEvent{result.value().report.size(),
                                           result.value().report.uploaded_count(),
                                           result.value().total_bytes,
                                           to_millis(Clock::now() - started)});
    return result;
}

Result<UploadResult> TransferOrchestrator::run_upload(const std::vector<fs::path>& local_paths,
                                                      const std::string& remote_destination,
                                                      const ProgressCallback& progress) {
    // Owns the scratch archives until this function returns
    auto built = builder_.build(local_paths, remote_destination);
    if (built.is_error()) {
        return Err<UploadResult>(built.error());
    }

    TransferManifest manifest = built.value().manifest;
    publish(events::TransferStartedEvent{manifest.size(), remote_destination});

    transport::ExecutorSession session(executor_);
    if (auto opened = session.open(); opened.is_error()) {
        return Err<UploadResult>(opened.error());
    }

    RemoteManifestProtocol protocol(executor_, config_, scripts_, id_generator_);

    auto phase_started = Clock::now();
    auto checked = protocol.check(manifest);
    if (checked.is_error()) {
        return Err<UploadResult>(checked.error());
    }
    manifest = manifest.merged(checked.value());
    const auto dirty_check_time = Clock::now() - phase_started;
    publish(events::PhaseCompletedEvent{"dirty_check", to_millis(dirty_check_time)});

    const std::uint64_t total_bytes = manifest.dirty_wire_bytes();

    phase_started = Clock::now();
    auto streamed = stream_files(manifest, total_bytes, progress);
    if (streamed.is_error()) {
        return Err<UploadResult>(streamed.error());
    }
    manifest = manifest.merged(streamed.value());
    const auto stream_time = Clock::now() - phase_started;
    publish(events::PhaseCompletedEvent{"stream_files", to_millis(stream_time)});

    phase_started = Clock::now();
    auto decoded = protocol.decode(manifest);
    if (decoded.is_error()) {
        return Err<UploadResult>(decoded.error());
    }
    manifest = manifest.merged(decoded.value());
    const auto decode_time = Clock::now() - phase_started;
    publish(events::PhaseCompletedEvent{"decode", to_millis(decode_time)});

    session.close();

    spdlog::debug("Uploaded {} items dirty_check: {} stream_files: {} decode: {}",
                  manifest.size(), format_duration(dirty_check_time),
                  format_duration(stream_time), format_duration(decode_time));

    for (const auto* item : manifest.dirty_items()) {
        if (!item->verified.value_or(false)) {
            spdlog::warn("{} was uploaded to {} but the remote side did not verify it (remote hash {})",
                         item->source.string(), item->destination, item->remote_hash.value_or("<none>"));
        }
    }

    return Ok(UploadResult{total_bytes, TransferReport(manifest)});
}

Result<UploadReport> TransferOrchestrator::stream_files(const TransferManifest& manifest,
                                                        std::uint64_t total_bytes,
                                                        const ProgressCallback& progress) {
    UploadReport report;

    for (const auto& item : manifest.items()) {
        if (!item.is_dirty()) {
            spdlog::debug("File {} is up to date, skipping", item.destination);
            publish(events::ItemSkippedEvent{item.content_hash, item.source.string(), item.destination});
            continue;
        }

        const std::string tmpfile = builder_.remote_temp_path(item.content_hash);
        auto on_chunk = [&, this](std::uint64_t bytes_so_far) {
            publish(events::ChunkWrittenEvent{item.content_hash, item.source.string(), bytes_so_far, total_bytes});
            if (progress) {
                progress(bytes_so_far, total_bytes, item.source, item.destination);
            }
        };

        auto uploaded = encoder_.upload_file(item.payload_path(), tmpfile, on_chunk);
        if (uploaded.is_error()) {
            spdlog::error("Failed to upload {} to {}: {}", item.source.string(), tmpfile, uploaded.error().message);
            return Err<UploadReport>(uploaded.error());
        }

        const auto& stats = uploaded.value();
        report.emplace(item.content_hash, UploadEntry{tmpfile, stats.chunk_count, stats.bytes_transferred});
        publish(events::ItemUploadedEvent{item.content_hash, item.source.string(), tmpfile,
                                          stats.chunk_count, stats.bytes_transferred});
    }

    return Ok(std::move(report));
}

} // namespace rft::transfer
