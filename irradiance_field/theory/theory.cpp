#include "theory.h"
#include "constants.h"
#include "errors.h"
#include <cmath>
#include <limits>
#include <string>

namespace irradiance::theory {

// 单位约定: length in m, power in W, result irradiance in W/m²

double TheoryCalculator::corner_view_factor(double a, double b, double c) {
    const double X = a / c;
    const double Y = b / c;
    const double sx = std::sqrt(1.0 + X * X);
    const double sy = std::sqrt(1.0 + Y * Y);
    return (X / sx * std::atan(Y / sx) + Y / sy * std::atan(X / sy)) / TWO_PI;
}

double TheoryCalculator::irradiance_at(const LambertianRectangle& source, double x, double y, double standoff) {
    const Geometry2D& size = source.get_size();
    const PlacementOffset& center = source.get_center();

    // 光源四个边相对于接收点的位置
    const double x0 = center.x - 0.5 * size.length - x;
    const double x1 = center.x + 0.5 * size.length - x;
    const double y0 = center.y - 0.5 * size.height - y;
    const double y1 = center.y + 0.5 * size.height - y;

    const double view_factor = corner_view_factor(x1, y1, standoff)
                             - corner_view_factor(x0, y1, standoff)
                             - corner_view_factor(x1, y0, standoff)
                             + corner_view_factor(x0, y0, standoff);

    return source.get_exitance() * view_factor;
}

double TheoryCalculator::point_source_irradiance(double power, double standoff) {
    return power * INV_PI / (standoff * standoff);
}

IrradianceField TheoryCalculator::calculate_field(const FieldProblem& problem) {
    if (!(problem.radiometry.standoff_m > 0.0)) {
        throw InvalidDistance("Theory: standoff distance must be > 0, got " +
                              std::to_string(problem.radiometry.standoff_m));
    }
    if (!(problem.source.length > 0.0) || !(problem.source.height > 0.0)) {
        throw InvalidGeometry("Theory: source dimensions must be > 0");
    }

    LambertianRectangle source(problem.source, problem.placement, problem.radiometry.power_watts);
    IrradianceField field(problem.grid.accuracy, problem.receiver);

    for (int row = 0; row < field.rows(); ++row) {
        const double y = field.y_at(row);
        for (int col = 0; col < field.cols(); ++col) {
            field.at(row, col) = irradiance_at(source, field.x_at(col), y, problem.radiometry.standoff_m);
        }
    }
    return field;
}

double TheoryCalculator::calculate_relative_error(double numerical, double analytic) {
    if (analytic == 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return std::abs(numerical - analytic) / std::abs(analytic) * 100.0;
}

double TheoryCalculator::max_relative_error(const IrradianceField& numerical, const IrradianceField& analytic) {
    if (numerical.resolution() != analytic.resolution()) {
        throw InvalidGrid("Cannot compare fields of resolution " + std::to_string(numerical.resolution()) +
                          " and " + std::to_string(analytic.resolution()));
    }

    double worst = 0.0;
    const auto& a = analytic.values();
    const auto& n = numerical.values();
    for (size_t i = 0; i < a.size(); ++i) {
        double err = calculate_relative_error(n[i], a[i]);
        if (err > worst) worst = err;
    }
    return worst;
}

} // namespace irradiance::theory
