#pragma once

#include <string>

namespace panxfer::core {

inline constexpr const char* kDefaultLogPattern = "[%H:%M:%S] [%^%l%$] %v";

/**
 * @brief Configure the default spdlog logger
 *
 * Unknown level names fall back to info.
 */
void setup_logging(const std::string& level, const std::string& pattern = kDefaultLogPattern);

} // namespace panxfer::core
