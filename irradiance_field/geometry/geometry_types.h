#pragma once

// Plain value types describing one irradiance computation.
// They carry no logic beyond trivial helpers and are rebuilt per request.
//
// 单位约定：所有长度单位使用米(m)，功率单位使用瓦(W)
//
// Coordinate frame: the receiver occupies [0, length] x [0, height] in the
// XY plane; the source plane is parallel to it at distance `standoff_m`.

namespace irradiance {

// 矩形尺寸 (光源或接收面)
struct Geometry2D {
    double length = 1.0;  // m, along X
    double height = 1.0;  // m, along Y

    double max_extent() const { return length > height ? length : height; }
    double area() const { return length * height; }
};

/**
 * @brief Position of the source rectangle in the receiver frame.
 *
 * The offset always names the CENTER of the source rectangle.
 * Callers holding a corner-anchored placement convert it with from_corner().
 */
struct PlacementOffset {
    double x = 0.0;  // m
    double y = 0.0;  // m

    static PlacementOffset from_corner(double corner_x, double corner_y, const Geometry2D& source) {
        return {corner_x + 0.5 * source.length, corner_y + 0.5 * source.height};
    }
};

// 光源总功率与两平面间距
struct RadiometricSpec {
    double power_watts = 500.0;  // W, total emitted power
    double standoff_m = 500.0;   // m, perpendicular source-receiver distance
};

// 接收面采样网格: accuracy x accuracy 个点
struct GridSpec {
    int accuracy = 30;
};

/**
 * @brief Full geometric and radiometric description of one computation.
 *
 * Defaults reproduce the reference configuration: a 1x1 m source centered
 * over a 100x100 m receiver at 500 m, emitting 500 W.
 */
struct FieldProblem {
    Geometry2D receiver = {100.0, 100.0};
    Geometry2D source = {1.0, 1.0};
    PlacementOffset placement = {50.0, 50.0};
    RadiometricSpec radiometry;
    GridSpec grid;
};

} // namespace irradiance
