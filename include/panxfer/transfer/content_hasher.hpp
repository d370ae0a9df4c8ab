#pragma once

#include "panxfer/core/result.hpp"
#include "panxfer/core/task_runner.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <future>
#include <string>

namespace panxfer::transfer {

/**
 * @brief Fingerprint and exact length of a local file
 */
struct ContentFingerprint {
    std::string hex;          ///< Lowercase hex MD5
    std::uint64_t length = 0; ///< Bytes actually hashed
};

/**
 * @brief Streams a file through MD5 in fixed-size buffers
 *
 * The whole file is never held in memory. The reported length is the
 * number of bytes fed to the digest, so it matches the fingerprint even
 * if the file changes size while being read.
 */
class ContentHasher {
public:
    static constexpr std::size_t kDefaultBufferSize = 8 * 1024;

    explicit ContentHasher(std::size_t buffer_size = kDefaultBufferSize);

    Result<ContentFingerprint> hash_file(const std::filesystem::path& path) const;

    /// Run hash_file on the runner instead of the calling thread
    std::future<Result<ContentFingerprint>> hash_file_async(const std::filesystem::path& path,
                                                            core::TaskRunner& runner) const;

    static Result<ContentFingerprint> hash_bytes(const std::string& bytes);

private:
    std::size_t buffer_size_;
};

} // namespace panxfer::transfer
