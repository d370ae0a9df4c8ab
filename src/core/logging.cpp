#include "panxfer/core/logging.hpp"

#include <spdlog/spdlog.h>

namespace panxfer::core {

void setup_logging(const std::string& level, const std::string& pattern) {
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
    spdlog::set_pattern(pattern);
}

} // namespace panxfer::core
