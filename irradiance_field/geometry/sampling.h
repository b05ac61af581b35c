#pragma once

#include <cstddef>
#include <vector>
#include "geometry/geometry_types.h"

namespace irradiance {

struct SamplePoint {
    double x = 0.0;
    double y = 0.0;
};

/**
 * @brief Evenly spaced samples over [start, stop], both ends included.
 *
 * Every value is generated as `start + i * step` from the integer index, so
 * no rounding error accumulates along the axis. The last sample is pinned to
 * `stop` exactly. A single sample sits at the midpoint of the interval.
 *
 * @param count Number of samples (>= 1).
 */
std::vector<double> uniform_samples(double start, double stop, int count);

/**
 * @brief Receiver evaluation grid along one axis: [0, extent], `count` points.
 */
std::vector<double> receiver_axis(double extent, int count);

/**
 * @brief Source sample coordinates along one axis, centered on `center`.
 *
 * Covers [center - extent/2, center + extent/2].
 */
std::vector<double> source_axis(double extent, double center, int count);

/**
 * @brief All source sample points, `per_axis` x `per_axis` of them,
 *        X-major (the Y index runs fastest).
 */
std::vector<SamplePoint> source_points(const Geometry2D& source,
                                       const PlacementOffset& placement,
                                       int per_axis);

} // namespace irradiance
