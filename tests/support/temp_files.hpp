#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>

namespace panxfer::testing {

inline std::filesystem::path create_temp_dir(const std::string& prefix) {
    static std::atomic<std::uint64_t> counter{0};
    static const auto run = std::random_device{}();
    const auto id = counter.fetch_add(1);
    auto dir = std::filesystem::temp_directory_path() /
               (prefix + "_" + std::to_string(run) + "_" + std::to_string(id));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

/// Deterministic non-repeating-ish content of the given size
inline std::string patterned_bytes(std::size_t size) {
    std::string bytes(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<char>((i * 31 + i / 251) & 0xFF);
    }
    return bytes;
}

} // namespace panxfer::testing
