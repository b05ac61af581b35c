#include "logging.h"
#include <spdlog/spdlog.h>

namespace irradiance {

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
    spdlog::info("Global log level set to {}.", log_level_name(level));
}

std::string log_level_name(spdlog::level::level_enum level) {
    const auto name = spdlog::level::to_string_view(level);
    return std::string(name.data(), name.size());
}

} // namespace irradiance
