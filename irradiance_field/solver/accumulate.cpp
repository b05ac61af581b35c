#include "accumulate.h"
#include "omp_config.h"

namespace irradiance {

void add_point_contribution(const ReceiverGrid& grid,
                            const SamplePoint& source,
                            double standoff_sq,
                            double intensity,
                            std::vector<double>& field)
{
    const size_t cols = grid.x.size();
    for (size_t row = 0; row < grid.y.size(); ++row) {
        const double dy = grid.y[row] - source.y;
        const double dy_sq = dy * dy;
        double* out = field.data() + row * cols;
        for (size_t col = 0; col < cols; ++col) {
            const double dx = grid.x[col] - source.x;
            const double d_sq = dx * dx + dy_sq;
            const double r_sq = d_sq + standoff_sq;
            // cos²α = 1 / (1 + d²/L²); stays in [0, 1] even when L² overflows
            const double cos_sq = 1.0 / (1.0 + d_sq / standoff_sq);
            out[col] += intensity * cos_sq / r_sq;
        }
    }
}

void accumulate_sequential(const ReceiverGrid& grid,
                           const std::vector<SamplePoint>& sources,
                           double standoff,
                           double intensity,
                           std::vector<double>& field)
{
    const double standoff_sq = standoff * standoff;
    for (const SamplePoint& s : sources) {
        add_point_contribution(grid, s, standoff_sq, intensity, field);
    }
}

int accumulate_parallel(const ReceiverGrid& grid,
                        const std::vector<SamplePoint>& sources,
                        double standoff,
                        double intensity,
                        std::vector<double>& field,
                        int num_threads)
{
    const double standoff_sq = standoff * standoff;
    const int count = static_cast<int>(sources.size());
    const int threads = num_threads > 0 ? num_threads : omp_get_max_threads();
    int used_threads = 1;

#pragma omp parallel num_threads(threads)
    {
        std::vector<double> partial(field.size(), 0.0);

#pragma omp for schedule(static)
        for (int k = 0; k < count; ++k) {
            add_point_contribution(grid, sources[k], standoff_sq, intensity, partial);
        }

#pragma omp critical(irradiance_partial_reduce)
        {
            for (size_t c = 0; c < field.size(); ++c) {
                field[c] += partial[c];
            }
        }

#pragma omp single
        used_threads = omp_get_num_threads();
    }

    return used_threads;
}

} // namespace irradiance
