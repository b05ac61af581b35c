#pragma once

#include <string>
#include <spdlog/common.h>

namespace irradiance {

// 设置全局日志级别 (spdlog), Python 端通过 _core.set_log_level 调用
void set_log_level(spdlog::level::level_enum level);

// "trace", "debug", "info", ...
std::string log_level_name(spdlog::level::level_enum level);

} // namespace irradiance
