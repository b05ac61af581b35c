#include "sampling.h"
#include "errors.h"
#include <string>

namespace irradiance {

std::vector<double> uniform_samples(double start, double stop, int count) {
    if (count < 1) {
        throw InvalidGrid("uniform_samples: count must be >= 1, got " + std::to_string(count));
    }

    std::vector<double> samples(static_cast<size_t>(count));
    if (count == 1) {
        samples[0] = 0.5 * (start + stop);
        return samples;
    }

    const double step = (stop - start) / static_cast<double>(count - 1);
    for (int i = 0; i < count; ++i) {
        samples[i] = start + static_cast<double>(i) * step;
    }
    samples[count - 1] = stop;
    return samples;
}

std::vector<double> receiver_axis(double extent, int count) {
    return uniform_samples(0.0, extent, count);
}

std::vector<double> source_axis(double extent, double center, int count) {
    const double half = 0.5 * extent;
    std::vector<double> samples = uniform_samples(-half, half, count);
    for (double& s : samples) {
        s += center;
    }
    return samples;
}

std::vector<SamplePoint> source_points(const Geometry2D& source,
                                       const PlacementOffset& placement,
                                       int per_axis) {
    const std::vector<double> xs = source_axis(source.length, placement.x, per_axis);
    const std::vector<double> ys = source_axis(source.height, placement.y, per_axis);

    std::vector<SamplePoint> points;
    points.reserve(xs.size() * ys.size());
    for (double x : xs) {
        for (double y : ys) {
            points.push_back({x, y});
        }
    }
    return points;
}

} // namespace irradiance
