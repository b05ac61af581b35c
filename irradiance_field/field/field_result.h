#pragma once

#include "field/irradiance_field.h"

namespace irradiance {

// 计算结果
struct FieldResult {
    IrradianceField field;              // N x N, calibrated units (W/m^2 / calibration_divisor)
    FieldStats stats;                   // min/max of `field`
    int source_samples_per_axis = 0;    // 光源每轴采样点数
    double correction_factor = 1.0;     // 小距离修正系数 (1.0 = 未修正)
    double calibration_divisor = 1.0;   // 标定除数
    double elapsed_ms = 0.0;            // 计算耗时
};

} // namespace irradiance
