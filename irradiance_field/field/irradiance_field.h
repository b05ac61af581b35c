#pragma once

#include <cstddef>
#include <vector>
#include "geometry/geometry_types.h"

namespace irradiance {

// 场统计量 (供外部显示层使用，无需重新计算场)
struct FieldStats {
    double min = 0.0;
    double max = 0.0;
    double ratio = 0.0;     // max / min, +inf when min == 0 and max > 0
    int min_row = 0;
    int min_col = 0;
    int max_row = 0;
    int max_col = 0;
    double max_x = 0.0;     // m, receiver position of the maximum
    double max_y = 0.0;     // m
};

/**
 * @brief N x N irradiance samples over the receiver plane.
 *
 * Row-major storage. The row index walks the receiver Y axis and the column
 * index walks the X axis, so row 0 / column 0 is the receiver corner at the
 * origin (image convention with origin at the lower-left).
 */
class IrradianceField {
public:
    IrradianceField() = default;

    /**
     * @param resolution Grid points per axis (>= 2).
     * @param receiver Receiver rectangle the grid spans.
     */
    IrradianceField(int resolution, const Geometry2D& receiver);

    int resolution() const { return resolution_; }
    int rows() const { return resolution_; }
    int cols() const { return resolution_; }
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    const Geometry2D& receiver() const { return receiver_; }

    double& at(int row, int col) { return values_[index(row, col)]; }
    double at(int row, int col) const { return values_[index(row, col)]; }

    // 网格点在接收面上的物理坐标 (m)
    double x_at(int col) const;
    double y_at(int row) const;

    std::vector<double>& values() { return values_; }
    const std::vector<double>& values() const { return values_; }

    // Multiplies every cell by `factor`.
    void scale(double factor);

    FieldStats compute_stats() const;

private:
    size_t index(int row, int col) const {
        return static_cast<size_t>(row) * static_cast<size_t>(resolution_) + static_cast<size_t>(col);
    }

    int resolution_ = 0;
    Geometry2D receiver_;
    std::vector<double> values_;
};

} // namespace irradiance
