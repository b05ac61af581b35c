#pragma once

#include <cstddef>
#include <vector>
#include "geometry/sampling.h"

namespace irradiance {

// Receiver evaluation points, separable along X and Y.
struct ReceiverGrid {
    std::vector<double> x;  // column coordinates
    std::vector<double> y;  // row coordinates
};

/**
 * @brief Adds the irradiance of one point source onto a row-major field.
 *
 * Per receiver point: r^2 = dx^2 + dy^2 + L^2, cos(a) = L / r,
 * E = I * cos^2(a) / r^2. The cosine is formed as cos^2(a) = L^2 / r^2,
 * which is exact when the source sits directly above the receiver point.
 */
void add_point_contribution(const ReceiverGrid& grid,
                            const SamplePoint& source,
                            double standoff_sq,
                            double intensity,
                            std::vector<double>& field);

/**
 * @brief Single-threaded sum over all source samples, in sample order.
 */
void accumulate_sequential(const ReceiverGrid& grid,
                           const std::vector<SamplePoint>& sources,
                           double standoff,
                           double intensity,
                           std::vector<double>& field);

/**
 * @brief Parallel sum over source samples.
 *
 * Each OpenMP thread accumulates into a private partial field; partial fields
 * are added into `field` once the thread's share of samples is done.
 *
 * @param num_threads Thread count, 0 = OpenMP default.
 * @return Number of threads that took part.
 */
int accumulate_parallel(const ReceiverGrid& grid,
                        const std::vector<SamplePoint>& sources,
                        double standoff,
                        double intensity,
                        std::vector<double>& field,
                        int num_threads);

} // namespace irradiance
