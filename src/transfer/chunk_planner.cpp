#include "panxfer/transfer/chunk_planner.hpp"

namespace panxfer::transfer {

ChunkPlanner::ChunkPlanner(std::filesystem::path path, std::size_t part_size)
    : path_(std::move(path)),
      part_size_(part_size == 0 ? kDefaultPartSize : part_size) {}

Result<void> ChunkPlanner::open() {
    input_.open(path_, std::ios::binary);
    if (!input_) {
        return Err<void>(io_error("Failed to open source file: " + path_.string()));
    }
    return Ok();
}

Result<std::optional<FilePart>> ChunkPlanner::next() {
    if (!input_.is_open()) {
        return Err<std::optional<FilePart>>(io_error("Source file is not open: " + path_.string()));
    }

    FilePart part;
    part.bytes.resize(part_size_);
    input_.read(part.bytes.data(), static_cast<std::streamsize>(part_size_));
    const auto bytes_read = static_cast<std::size_t>(input_.gcount());
    if (input_.bad()) {
        return Err<std::optional<FilePart>>(io_error("Read failed on source file: " + path_.string()));
    }
    if (bytes_read == 0) {
        return Ok(std::optional<FilePart>{});
    }

    part.bytes.resize(bytes_read);
    part.part_number = next_part_number_++;
    part.offset = offset_;
    offset_ += bytes_read;
    return Ok(std::optional<FilePart>{std::move(part)});
}

std::uint64_t ChunkPlanner::expected_part_count(std::uint64_t size, std::size_t part_size) noexcept {
    if (part_size == 0) {
        return 0;
    }
    return (size + part_size - 1) / part_size;
}

} // namespace panxfer::transfer
