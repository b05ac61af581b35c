#pragma once

#include <variant>

// This header is a PURE C++ header.
// It defines the parameter-holding structs that configure the solver.
// Every empirical constant of the model lives here as a named field.

namespace irradiance {

// --- Source sampling policies ---

// One source sample per receiver sample: N x N source points.
struct MatchReceiver {};

// clamp(N / divisor, min_per_axis, max_per_axis) source samples per axis.
struct AdaptiveSampling {
    int divisor = 10;
    int min_per_axis = 2;
    int max_per_axis = 10;
};

// Explicit sample count per axis. A count of 1 is the point-source limit.
struct FixedSampling {
    int per_axis = 10;
};

using SourceSampling = std::variant<
    AdaptiveSampling,
    MatchReceiver,
    FixedSampling
>;

/**
 * @brief Source samples per axis for a receiver grid of `receiver_accuracy` points.
 *
 * Throws InvalidGrid when the policy itself is malformed.
 */
int resolve_samples_per_axis(const SourceSampling& sampling, int receiver_accuracy);

// --- Scheduling ---

enum class ExecutionPolicy {
    Sequential,  // single thread, deterministic summation order
    Parallel     // OpenMP parallel-for over source samples with per-thread partial fields
};

/**
 * @brief Empirical near-field boost.
 *
 * When L < threshold_factor * max(l_s, h_s) the whole field is multiplied by
 * 1 + coefficient * max(l_s, h_s) / L. Approximate, not derived from the
 * radiometric model.
 */
struct SmallDistanceCorrection {
    bool enabled = true;
    double threshold_factor = 10.0;
    double coefficient = 0.1;
};

// 求解器配置
struct SolverConfig {
    SourceSampling source_sampling = AdaptiveSampling{};
    SmallDistanceCorrection small_distance_correction;

    // 标定除数: 参考配置 "10 m, 10 W 时的最大功率密度"
    double calibration_divisor = 0.005;

    ExecutionPolicy execution = ExecutionPolicy::Parallel;
    int num_threads = 0;  // 0 = OpenMP default, < 0 rejected

    // Raw W/m^2 output: no near-field correction, divisor 1.
    static SolverConfig physical_units() {
        SolverConfig config;
        config.small_distance_correction.enabled = false;
        config.calibration_divisor = 1.0;
        return config;
    }
};

} // namespace irradiance
