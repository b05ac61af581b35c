#include "irradiance_field.h"
#include <limits>
#include "errors.h"
#include <string>

namespace irradiance {

IrradianceField::IrradianceField(int resolution, const Geometry2D& receiver)
    : resolution_(resolution), receiver_(receiver)
{
    if (resolution < 2) {
        throw InvalidGrid("IrradianceField: resolution must be >= 2, got " + std::to_string(resolution));
    }
    values_.assign(static_cast<size_t>(resolution) * static_cast<size_t>(resolution), 0.0);
}

double IrradianceField::x_at(int col) const {
    if (col == resolution_ - 1) {
        return receiver_.length;
    }
    return static_cast<double>(col) * (receiver_.length / static_cast<double>(resolution_ - 1));
}

double IrradianceField::y_at(int row) const {
    if (row == resolution_ - 1) {
        return receiver_.height;
    }
    return static_cast<double>(row) * (receiver_.height / static_cast<double>(resolution_ - 1));
}

void IrradianceField::scale(double factor) {
    for (double& v : values_) {
        v *= factor;
    }
}

FieldStats IrradianceField::compute_stats() const {
    FieldStats stats;
    if (values_.empty()) {
        return stats;
    }

    size_t min_idx = 0;
    size_t max_idx = 0;
    for (size_t i = 1; i < values_.size(); ++i) {
        if (values_[i] < values_[min_idx]) min_idx = i;
        if (values_[i] > values_[max_idx]) max_idx = i;
    }

    const size_t n = static_cast<size_t>(resolution_);
    stats.min = values_[min_idx];
    stats.max = values_[max_idx];
    stats.min_row = static_cast<int>(min_idx / n);
    stats.min_col = static_cast<int>(min_idx % n);
    stats.max_row = static_cast<int>(max_idx / n);
    stats.max_col = static_cast<int>(max_idx % n);
    stats.max_x = x_at(stats.max_col);
    stats.max_y = y_at(stats.max_row);

    if (stats.min > 0.0) {
        stats.ratio = stats.max / stats.min;
    } else if (stats.max > 0.0) {
        stats.ratio = std::numeric_limits<double>::infinity();
    } else {
        stats.ratio = 0.0;
    }
    return stats;
}

} // namespace irradiance
