#pragma once

// 数学常量定义
// 这些常量在整个项目中使用

namespace irradiance {

    constexpr double PI = 3.14159265358979323846;
    constexpr double TWO_PI = 2.0 * PI;
    constexpr double INV_PI = 1.0 / PI;

} // namespace irradiance
