#include "panxfer/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <sstream>

namespace panxfer::core {
namespace {

Error config_error(std::string message) {
    return Error(ErrorKind::Config, std::move(message));
}

template<typename T>
void read_field(const nlohmann::json& object, const char* key, T& target) {
    const auto it = object.find(key);
    if (it != object.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

/// Non-negative integer no larger than max; absent or null keeps the default.
template<typename T>
Result<void> read_count(const nlohmann::json& object, const char* key, T& target, std::uint64_t max) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return Ok();
    }
    if (!it->is_number_integer()) {
        return Err<void>(config_error(std::string(key) + " must be an integer"));
    }
    if (!it->is_number_unsigned() && it->get<std::int64_t>() < 0) {
        return Err<void>(config_error(std::string(key) + " must not be negative"));
    }
    const auto value = it->get<std::uint64_t>();
    if (value > max) {
        return Err<void>(config_error(std::string(key) + " must be at most " + std::to_string(max)));
    }
    target = static_cast<T>(value);
    return Ok();
}

} // namespace

Result<ClientConfig> config_from_json(const nlohmann::json& document) {
    if (!document.is_object()) {
        return Err<ClientConfig>(config_error("configuration root must be an object"));
    }

    ClientConfig config;
    try {
        read_field(document, "api_base", config.api_base);
        read_field(document, "log_level", config.log_level);

        for (auto counted : {
                 read_count(document, "part_size", config.part_size, kMaxPartSize),
                 read_count(document, "hash_buffer_size", config.hash_buffer_size, kMaxHashBufferSize),
                 read_count(document, "connect_timeout_seconds", config.connect_timeout_seconds, kMaxTimeoutSeconds),
                 read_count(document, "max_redirects", config.max_redirects, kMaxRedirects),
                 read_count(document, "transfer_workers", config.transfer_workers, kMaxTransferWorkers),
             }) {
            if (counted.is_error()) {
                return Err<ClientConfig>(counted.error());
            }
        }

        const auto profile = document.find("profile");
        if (profile != document.end() && profile->is_object()) {
            auto& p = config.profile;
            read_field(*profile, "user_agent", p.user_agent);
            read_field(*profile, "platform", p.platform);
            read_field(*profile, "app_version", p.app_version);
            read_field(*profile, "x_app_version", p.x_app_version);
            read_field(*profile, "x_channel", p.x_channel);
            read_field(*profile, "device_type", p.device_type);
            read_field(*profile, "device_name", p.device_name);
            read_field(*profile, "os_version", p.os_version);
        }
    } catch (const nlohmann::json::exception& e) {
        return Err<ClientConfig>(config_error(std::string("invalid configuration value: ") + e.what()));
    }

    if (config.part_size == 0) {
        return Err<ClientConfig>(config_error("part_size must be > 0"));
    }
    if (config.hash_buffer_size == 0) {
        return Err<ClientConfig>(config_error("hash_buffer_size must be > 0"));
    }
    if (config.transfer_workers == 0) {
        config.transfer_workers = 1;
    }
    while (!config.api_base.empty() && config.api_base.back() == '/') {
        config.api_base.pop_back();
    }
    return Ok(std::move(config));
}

Result<ClientConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<ClientConfig>(config_error("Failed to open config file: " + path.string()));
    }

    std::ostringstream content;
    content << input.rdbuf();

    auto document = nlohmann::json::parse(content.str(), nullptr, false);
    if (document.is_discarded()) {
        return Err<ClientConfig>(config_error("Config file is not valid JSON: " + path.string()));
    }

    auto config = config_from_json(document);
    if (config.is_ok()) {
        spdlog::debug("Loaded configuration from {}", path.string());
    }
    return config;
}

} // namespace panxfer::core
