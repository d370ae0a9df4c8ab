#pragma once

#include "panxfer/core/result.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace panxfer::core {

/**
 * @brief Device and app markers sent with every service request
 *
 * The service rejects requests that do not look like its mobile client,
 * so these default to the values of a known Android build.
 */
struct ClientProfile {
    std::string user_agent = "123pan/v2.4.0(Android_7.1.2;Xiaomi)";
    std::string platform = "android";
    std::string app_version = "61";
    std::string x_app_version = "2.4.0";
    std::string x_channel = "1004";
    std::string device_type = "M2101K9C";
    std::string device_name = "Xiaomi";
    std::string os_version = "Android_7.1.2";
};

// Upper bounds accepted from configuration files
constexpr std::uint64_t kMaxPartSize = 1024ull * 1024 * 1024;
constexpr std::uint64_t kMaxHashBufferSize = 64ull * 1024 * 1024;
constexpr std::uint64_t kMaxTimeoutSeconds = 3600;
constexpr std::uint64_t kMaxRedirects = 50;
constexpr std::uint64_t kMaxTransferWorkers = 64;

struct ClientConfig {
    std::string api_base = "https://www.123pan.com";
    ClientProfile profile;

    std::size_t part_size = 5 * 1024 * 1024;
    std::size_t hash_buffer_size = 8 * 1024;

    long connect_timeout_seconds = 30;  ///< 0 keeps the transport default
    long max_redirects = 10;
    std::size_t transfer_workers = 2;

    std::string log_level = "info";
};

/// Map a parsed JSON document onto a config; absent keys keep defaults.
Result<ClientConfig> config_from_json(const nlohmann::json& document);

Result<ClientConfig> load_config(const std::filesystem::path& path);

} // namespace panxfer::core
