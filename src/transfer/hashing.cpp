#include "rft/transfer/hashing.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace rft::transfer {
namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

std::string digest_to_hex(const unsigned char* digest, unsigned int length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

Result<EvpMdCtxPtr> new_md5_context() {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Err<EvpMdCtxPtr>(ErrorKind::LocalIo, "EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return Err<EvpMdCtxPtr>(ErrorKind::LocalIo, "EVP_DigestInit_ex failed");
    }
    return Ok(std::move(ctx));
}

Result<std::string> finish_md5(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &length) != 1) {
        return Err<std::string>(ErrorKind::LocalIo, "EVP_DigestFinal_ex failed");
    }
    return Ok(digest_to_hex(digest, length));
}

} // namespace

Result<std::string> md5_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorKind::LocalIo, "Failed to open file for hashing: " + path.string());
    }

    auto ctx = new_md5_context();
    if (ctx.is_error()) {
        return Err<std::string>(ctx.error());
    }

    char buffer[64 * 1024];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        const auto count = static_cast<std::size_t>(input.gcount());
        if (EVP_DigestUpdate(ctx.value().get(), buffer, count) != 1) {
            return Err<std::string>(ErrorKind::LocalIo, "EVP_DigestUpdate failed for " + path.string());
        }
    }
    if (input.bad()) {
        return Err<std::string>(ErrorKind::LocalIo, "Failed to read file for hashing: " + path.string());
    }

    return finish_md5(ctx.value().get());
}

std::string md5_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    EVP_Digest(data.data(), data.size(), digest, &length, EVP_md5(), nullptr);
    return digest_to_hex(digest, length);
}

std::string base64_encode(const char* data, std::size_t size) {
    if (size == 0) {
        return {};
    }
    std::string out(static_cast<std::size_t>(base64_length(size)) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        reinterpret_cast<const unsigned char*>(data),
                                        static_cast<int>(size));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::string base64_encode(const std::string& data) {
    return base64_encode(data.data(), data.size());
}

Result<std::vector<std::uint8_t>> base64_decode(const std::string& text) {
    std::string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact.push_back(c);
        }
    }
    if (compact.empty()) {
        return Ok(std::vector<std::uint8_t>{});
    }
    if (compact.size() % 4 != 0) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::LocalIo, "Invalid base64 length");
    }

    std::vector<std::uint8_t> out(compact.size() / 4 * 3);
    const int written = EVP_DecodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(compact.data()),
                                        static_cast<int>(compact.size()));
    if (written < 0) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::LocalIo, "Invalid base64 payload");
    }

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    std::size_t padding = 0;
    if (compact[compact.size() - 1] == '=') ++padding;
    if (compact[compact.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(written) - padding);
    return Ok(std::move(out));
}

} // namespace rft::transfer
