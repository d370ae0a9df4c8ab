#pragma once

#include "panxfer/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace panxfer::transfer {

/**
 * @brief One contiguous byte range of a file, numbered from 1
 */
struct FilePart {
    std::uint32_t part_number = 1;
    std::uint64_t offset = 0;
    std::string bytes;
};

/**
 * @brief Splits a file into fixed-size parts, read one at a time
 *
 * Parts come out dense and in order: 1, 2, 3, ... Only the last part
 * may be shorter than the part size. next() returns nullopt at EOF.
 */
class ChunkPlanner {
public:
    static constexpr std::size_t kDefaultPartSize = 5 * 1024 * 1024;

    ChunkPlanner(std::filesystem::path path, std::size_t part_size = kDefaultPartSize);

    Result<void> open();

    Result<std::optional<FilePart>> next();

    [[nodiscard]] std::size_t part_size() const noexcept { return part_size_; }
    [[nodiscard]] std::uint32_t parts_read() const noexcept { return next_part_number_ - 1; }

    /// ceil(size / part_size); zero for an empty file
    static std::uint64_t expected_part_count(std::uint64_t size, std::size_t part_size) noexcept;

private:
    std::filesystem::path path_;
    std::size_t part_size_;
    std::ifstream input_;
    std::uint32_t next_part_number_ = 1;
    std::uint64_t offset_ = 0;
};

} // namespace panxfer::transfer
