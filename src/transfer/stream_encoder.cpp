#include "rft/transfer/stream_encoder.hpp"

#include "rft/transfer/hashing.hpp"
#include "rft/transfer/response_decoder.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <vector>

namespace rft::transfer {
namespace fs = std::filesystem;

namespace {

constexpr const char* kAppendPrefix = "echo ";
constexpr const char* kAppendInfix = " >> \"";
constexpr const char* kAppendSuffix = "\"";
constexpr std::uint64_t kLogEveryChunks = 25;

} // namespace

ChunkedStreamEncoder::ChunkedStreamEncoder(transport::CommandExecutor& executor,
                                           const config::TransferConfig& config)
    : executor_(executor), config_(config) {}

std::string ChunkedStreamEncoder::truncate_command(const std::string& cmd_destination) {
    return "echo|set /p=>\"" + cmd_destination + "\"";
}

std::string ChunkedStreamEncoder::append_command(const std::string& encoded, const std::string& cmd_destination) {
    std::string command;
    command.reserve(encoded.size() + cmd_destination.size() + 16);
    command += kAppendPrefix;
    command += encoded;
    command += kAppendInfix;
    command += cmd_destination;
    command += kAppendSuffix;
    return command;
}

std::string ChunkedStreamEncoder::to_cmd_path(const std::string& destination) const {
    const auto& ps_prefix = config_.remote_temp_dir;
    if (!ps_prefix.empty() && destination.compare(0, ps_prefix.size(), ps_prefix) == 0) {
        return config_.remote_cmd_temp_dir + destination.substr(ps_prefix.size());
    }
    return destination;
}

Result<std::size_t> ChunkedStreamEncoder::chunk_budget(const std::string& destination) const {
    const std::string cmd_destination = to_cmd_path(destination);
    const std::size_t overhead = append_command("", cmd_destination).size();

    if (overhead >= config_.max_command_length) {
        return Err<std::size_t>(ErrorKind::CommandTooLong,
                                "The command line is too long: destination path " + cmd_destination +
                                " leaves no room for data within " +
                                std::to_string(config_.max_command_length) + " characters");
    }

    const std::size_t budget = (config_.max_command_length - overhead) / 4 * 4;
    if (budget == 0) {
        return Err<std::size_t>(ErrorKind::CommandTooLong,
                                "The command line is too long: no room for a base64 quantum after " +
                                cmd_destination);
    }
    return Ok(budget);
}

Result<void> ChunkedStreamEncoder::run(const std::string& command) const {
    if (command.size() > config_.max_command_length) {
        return Err<void>(ErrorKind::CommandTooLong,
                         "The command line is too long: " + std::to_string(command.size()) +
                         " characters exceeds " + std::to_string(config_.max_command_length));
    }

    auto output = executor_.run_cmd(command);
    if (output.is_error()) {
        return Err<void>(output.error());
    }
    return ResponseDecoder::classify(output.value());
}

Result<StreamUploadResult> ChunkedStreamEncoder::upload(std::istream& input,
                                                         const std::string& destination,
                                                         const ChunkProgress& progress) const {
    auto budget = chunk_budget(destination);
    if (budget.is_error()) {
        return Err<StreamUploadResult>(budget.error());
    }

    const std::string cmd_destination = to_cmd_path(destination);
    const std::size_t read_size = budget.value() / 4 * 3;

    // Guards against stale content left by an earlier failed run
    if (auto truncated = run(truncate_command(cmd_destination)); truncated.is_error()) {
        return Err<StreamUploadResult>(truncated.error());
    }

    StreamUploadResult result;
    std::vector<char> buffer(read_size);

    while (input.read(buffer.data(), static_cast<std::streamsize>(read_size)) || input.gcount() > 0) {
        const auto bytes_read = static_cast<std::size_t>(input.gcount());
        const std::string encoded = base64_encode(buffer.data(), bytes_read);

        if (auto appended = run(append_command(encoded, cmd_destination)); appended.is_error()) {
            return Err<StreamUploadResult>(appended.error());
        }

        ++result.chunk_count;
        result.bytes_transferred += encoded.size();
        if (result.chunk_count % kLogEveryChunks == 0) {
            spdlog::debug("Wrote chunk {} for {}", result.chunk_count, destination);
        }
        if (progress) {
            progress(result.bytes_transferred);
        }
    }

    if (input.bad()) {
        return Err<StreamUploadResult>(ErrorKind::LocalIo, "Failed reading input stream for " + destination);
    }

    return Ok(result);
}

Result<StreamUploadResult> ChunkedStreamEncoder::upload_file(const fs::path& source,
                                                              const std::string& destination,
                                                              const ChunkProgress& progress) const {
    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return Err<StreamUploadResult>(ErrorKind::LocalIo, "Failed to open source file: " + source.string());
    }

    spdlog::debug("Uploading {} to encoded tmpfile {}", source.string(), destination);
    const auto started = std::chrono::steady_clock::now();

    auto result = upload(input, destination, progress);
    if (result.is_error()) {
        return result;
    }

    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started);
    spdlog::debug("Finished uploading {} to encoded tmpfile {} ({} KB over {} chunks) in {:.2f}s",
                  source.string(), destination,
                  static_cast<double>(result.value().bytes_transferred) / 1000.0,
                  result.value().chunk_count, elapsed.count());
    return result;
}

} // namespace rft::transfer
