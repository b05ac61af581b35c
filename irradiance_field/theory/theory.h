#pragma once

#include <cmath>
#include "geometry/geometry_types.h"
#include "field/irradiance_field.h"

namespace irradiance::theory {

/**
 * @brief 代表一个均匀朗伯矩形光源的理论模型 (LambertianRectangle)。
 *
 * 光源总功率均匀分布在矩形面积上，辐射出射度 M = P / A，
 * 辐亮度 L = M / π。作为理论计算器(TheoryCalculator)的输入。
 */
class LambertianRectangle {
public:
    /**
     * @brief 构造一个理论矩形光源。
     * @param size 光源尺寸 (m)。
     * @param center 光源中心在接收面坐标系中的位置 (m)。
     * @param power 总辐射功率 (W)。
     */
    LambertianRectangle(const Geometry2D& size, const PlacementOffset& center, double power)
        : size_(size), center_(center), power_(power) {}

    const Geometry2D& get_size() const { return size_; }
    const PlacementOffset& get_center() const { return center_; }
    double get_power() const { return power_; }

    /**
     * @brief 辐射出射度 M = P / A (W/m²)。
     */
    double get_exitance() const { return power_ / size_.area(); }

private:
    Geometry2D size_;
    PlacementOffset center_;
    double power_;
};


/**
 * @brief 为平行平面几何执行理论计算。
 */
class TheoryCalculator {
public:
    /**
     * @brief View factor from a differential receiver element to a parallel
     *        rectangle of sides a x b with one corner on the element's normal.
     *
     * Standard closed form with X = a/c, Y = b/c:
     * F = 1/(2π) [ X/√(1+X²) atan(Y/√(1+X²)) + Y/√(1+Y²) atan(X/√(1+Y²)) ].
     * Signed a, b give a signed result (odd in each argument), so arbitrary
     * rectangles follow by superposition of four corner rectangles.
     *
     * @param c Plane separation (> 0).
     */
    static double corner_view_factor(double a, double b, double c);

    /**
     * @brief Exact irradiance (W/m²) at receiver point (x, y) from the source.
     *
     * E = M * F, F being the view factor from the point to the source rectangle.
     */
    static double irradiance_at(const LambertianRectangle& source, double x, double y, double standoff);

    /**
     * @brief On-axis irradiance of a Lambertian point source, E = (P/π) / L².
     */
    static double point_source_irradiance(double power, double standoff);

    /**
     * @brief Analytic counterpart of the numerical field, in raw W/m².
     *
     * Same grid and orientation as IrradianceSolver output; no near-field
     * correction and no calibration divisor.
     */
    static IrradianceField calculate_field(const FieldProblem& problem);

    /**
     * @brief |numerical - analytic| / analytic in percent (+inf when analytic is 0).
     */
    static double calculate_relative_error(double numerical, double analytic);

    /**
     * @brief Largest per-cell relative error (percent) between two fields of the same shape.
     */
    static double max_relative_error(const IrradianceField& numerical, const IrradianceField& analytic);
};

} // namespace irradiance::theory
