#include "display_norm.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace irradiance::display {

namespace {

double clamp01(double v) {
    return std::min(1.0, std::max(0.0, v));
}

} // namespace

DisplayNorm make_norm(const FieldStats& stats, NormType type, double gamma, double vcenter) {
    DisplayNorm norm;
    norm.type = type;
    norm.vmin = stats.min;
    norm.vmax = stats.max;
    norm.vcenter = vcenter;

    switch (type) {
        case NormType::TwoSlope:
            // 始终以 vcenter 为中性点, 必要时对称扩展范围
            if (norm.vmax < vcenter) {
                norm.vmax = 2.0 * vcenter - norm.vmin;
            } else if (norm.vmin > vcenter) {
                norm.vmin = 2.0 * vcenter - norm.vmax;
            }
            break;
        case NormType::Log:
            norm.vmin = std::max(LOG_NORM_FLOOR, stats.min);
            break;
        case NormType::Power:
            if (!(gamma > 0.0)) {
                throw std::invalid_argument("Power norm gamma must be > 0, got " + std::to_string(gamma));
            }
            norm.gamma = gamma;
            break;
        case NormType::Linear:
            break;
    }
    return norm;
}

double DisplayNorm::map(double value) const {
    switch (type) {
        case NormType::TwoSlope: {
            if (value < vcenter) {
                if (vcenter <= vmin) return 0.0;
                return clamp01(0.5 * (value - vmin) / (vcenter - vmin));
            }
            if (vmax <= vcenter) return 0.5;
            return clamp01(0.5 + 0.5 * (value - vcenter) / (vmax - vcenter));
        }
        case NormType::Log: {
            if (vmax <= vmin) return 0.0;
            const double v = std::max(value, vmin);
            return clamp01((std::log(v) - std::log(vmin)) / (std::log(vmax) - std::log(vmin)));
        }
        case NormType::Power: {
            if (vmax <= vmin) return 0.0;
            return std::pow(clamp01((value - vmin) / (vmax - vmin)), gamma);
        }
        case NormType::Linear:
        default:
            if (vmax <= vmin) return 0.0;
            return clamp01((value - vmin) / (vmax - vmin));
    }
}

} // namespace irradiance::display
