#pragma once

#include "rft/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace rft::transfer {

/// Lower-case hex MD5 of a local file, streamed in blocks.
Result<std::string> md5_file(const std::filesystem::path& path);

std::string md5_hex(const std::string& data);

/// Base64 without line breaks.
std::string base64_encode(const char* data, std::size_t size);
std::string base64_encode(const std::string& data);

/// Decodes base64 text, ignoring whitespace. Fails on malformed input.
Result<std::vector<std::uint8_t>> base64_decode(const std::string& text);

/// Number of characters base64 produces for size input bytes.
constexpr std::uint64_t base64_length(std::uint64_t size) {
    return (size + 2) / 3 * 4;
}

} // namespace rft::transfer
