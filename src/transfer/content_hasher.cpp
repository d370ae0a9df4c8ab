#include "panxfer/transfer/content_hasher.hpp"

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace panxfer::transfer {
namespace {

struct DigestDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestDeleter>;

Result<DigestContext> start_digest() {
    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return Err<DigestContext>(io_error("Failed to initialize MD5 digest"));
    }
    return Ok(std::move(ctx));
}

Result<std::string> finish_digest(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &digest_length) != 1) {
        return Err<std::string>(io_error("Failed to finalize MD5 digest"));
    }

    std::ostringstream hex;
    for (unsigned int i = 0; i < digest_length; ++i) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return Ok(hex.str());
}

} // namespace

ContentHasher::ContentHasher(std::size_t buffer_size)
    : buffer_size_(buffer_size == 0 ? kDefaultBufferSize : buffer_size) {}

Result<ContentFingerprint> ContentHasher::hash_file(const std::filesystem::path& path) const {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<ContentFingerprint>(io_error("Failed to open file for hashing: " + path.string()));
    }

    auto ctx = start_digest();
    if (ctx.is_error()) {
        return Err<ContentFingerprint>(ctx.error());
    }

    std::vector<char> buffer(buffer_size_);
    std::uint64_t length = 0;
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        const auto count = static_cast<std::size_t>(input.gcount());
        if (EVP_DigestUpdate(ctx.value().get(), buffer.data(), count) != 1) {
            return Err<ContentFingerprint>(io_error("Failed to update MD5 digest"));
        }
        length += count;
    }
    if (input.bad()) {
        return Err<ContentFingerprint>(io_error("Read failed while hashing: " + path.string()));
    }

    auto hex = finish_digest(ctx.value().get());
    if (hex.is_error()) {
        return Err<ContentFingerprint>(hex.error());
    }

    spdlog::debug("Hashed {} ({} bytes): {}", path.string(), length, hex.value());
    return Ok(ContentFingerprint{std::move(hex.value()), length});
}

std::future<Result<ContentFingerprint>> ContentHasher::hash_file_async(const std::filesystem::path& path,
                                                                       core::TaskRunner& runner) const {
    ContentHasher hasher(buffer_size_);
    return runner.submit([hasher, path]() { return hasher.hash_file(path); });
}

Result<ContentFingerprint> ContentHasher::hash_bytes(const std::string& bytes) {
    auto ctx = start_digest();
    if (ctx.is_error()) {
        return Err<ContentFingerprint>(ctx.error());
    }
    if (EVP_DigestUpdate(ctx.value().get(), bytes.data(), bytes.size()) != 1) {
        return Err<ContentFingerprint>(io_error("Failed to update MD5 digest"));
    }
    auto hex = finish_digest(ctx.value().get());
    if (hex.is_error()) {
        return Err<ContentFingerprint>(hex.error());
    }
    return Ok(ContentFingerprint{std::move(hex.value()), bytes.size()});
}

} // namespace panxfer::transfer
