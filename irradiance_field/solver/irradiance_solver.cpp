#include "irradiance_solver.h"
#include "solver/accumulate.h"
#include "errors.h"
#include "geometry/sampling.h"
#include "constants.h"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cmath>
#include <string>

namespace irradiance {

namespace {

void check_rectangle(const Geometry2D& rect, const char* name) {
    if (!std::isfinite(rect.length) || !std::isfinite(rect.height) ||
        rect.length <= 0.0 || rect.height <= 0.0) {
        throw InvalidGeometry(std::string(name) + " dimensions must be finite and > 0, got " +
                              std::to_string(rect.length) + " x " + std::to_string(rect.height));
    }
}

const char* policy_name(ExecutionPolicy policy) {
    return policy == ExecutionPolicy::Sequential ? "Sequential" : "Parallel";
}

} // namespace

IrradianceSolver::IrradianceSolver(const SolverConfig& config) : config_(config) {}

void IrradianceSolver::validate(const FieldProblem& problem, const SolverConfig& config) {
    check_rectangle(problem.receiver, "Receiver");
    check_rectangle(problem.source, "Source");
    if (!std::isfinite(problem.placement.x) || !std::isfinite(problem.placement.y)) {
        throw InvalidGeometry("Source placement must be finite");
    }

    if (problem.grid.accuracy < 2) {
        throw InvalidGrid("Grid accuracy must be >= 2, got " + std::to_string(problem.grid.accuracy));
    }
    resolve_samples_per_axis(config.source_sampling, problem.grid.accuracy);  // throws on a bad policy

    const double L = problem.radiometry.standoff_m;
    if (!std::isfinite(L) || L <= 0.0) {
        throw InvalidDistance("Standoff distance must be finite and > 0, got " + std::to_string(L));
    }
    if (L * L == 0.0) {
        throw InvalidDistance("Standoff distance is too small to resolve, got " + std::to_string(L));
    }

    const double P = problem.radiometry.power_watts;
    if (!std::isfinite(P) || P < 0.0) {
        throw InvalidPower("Source power must be finite and >= 0, got " + std::to_string(P));
    }

    if (!std::isfinite(config.calibration_divisor) || config.calibration_divisor <= 0.0) {
        throw InvalidCalibration("Calibration divisor must be finite and > 0, got " +
                                 std::to_string(config.calibration_divisor));
    }
    const SmallDistanceCorrection& c = config.small_distance_correction;
    if (!std::isfinite(c.coefficient) || c.coefficient < 0.0 ||
        !std::isfinite(c.threshold_factor) || c.threshold_factor < 0.0) {
        throw InvalidCalibration("Small-distance correction constants must be finite and >= 0");
    }

    if (config.num_threads < 0) {
        throw InvalidGrid("num_threads must be >= 0 (0 = OpenMP default), got " +
                          std::to_string(config.num_threads));
    }
}

double IrradianceSolver::small_distance_factor(const FieldProblem& problem,
                                               const SmallDistanceCorrection& correction) {
    if (!correction.enabled) {
        return 1.0;
    }
    const double extent = problem.source.max_extent();
    const double L = problem.radiometry.standoff_m;
    if (L < correction.threshold_factor * extent) {
        return 1.0 + correction.coefficient * (extent / L);
    }
    return 1.0;
}

FieldResult IrradianceSolver::run(const FieldProblem& problem) const {
    validate(problem, config_);

    const int n = problem.grid.accuracy;
    const int per_axis = resolve_samples_per_axis(config_.source_sampling, n);
    if (per_axis > n) {
        spdlog::warn("Source sampling ({} per axis) is finer than the receiver grid ({} per axis).", per_axis, n);
    }

    spdlog::debug("🚀 Computing irradiance field...");
    spdlog::debug("   Receiver: {} x {} m, grid {} x {}", problem.receiver.length, problem.receiver.height, n, n);
    spdlog::debug("   Source: {} x {} m centered at ({}, {}), {} x {} samples",
                  problem.source.length, problem.source.height,
                  problem.placement.x, problem.placement.y, per_axis, per_axis);
    spdlog::debug("   Power: {} W, standoff: {} m, policy: {}",
                  problem.radiometry.power_watts, problem.radiometry.standoff_m, policy_name(config_.execution));

    auto start_time = std::chrono::high_resolution_clock::now();

    ReceiverGrid grid;
    grid.x = receiver_axis(problem.receiver.length, n);
    grid.y = receiver_axis(problem.receiver.height, n);

    const std::vector<SamplePoint> sources = source_points(problem.source, problem.placement, per_axis);

    // 功率均匀分配到每个采样点, 朗伯点源强度 I = Φ / π
    const double power_per_point = problem.radiometry.power_watts / static_cast<double>(sources.size());
    const double intensity = power_per_point * INV_PI;

    FieldResult result;
    result.field = IrradianceField(n, problem.receiver);
    result.source_samples_per_axis = per_axis;
    result.calibration_divisor = config_.calibration_divisor;

    if (config_.execution == ExecutionPolicy::Sequential) {
        accumulate_sequential(grid, sources, problem.radiometry.standoff_m, intensity, result.field.values());
    } else {
        int threads = accumulate_parallel(grid, sources, problem.radiometry.standoff_m, intensity,
                                          result.field.values(), config_.num_threads);
        spdlog::debug("   Accumulated on {} thread(s)", threads);
    }

    result.correction_factor = small_distance_factor(problem, config_.small_distance_correction);
    if (result.correction_factor != 1.0) {
        spdlog::debug("   Near-field correction x{:.6f} (L = {} m, source extent = {} m)",
                      result.correction_factor, problem.radiometry.standoff_m, problem.source.max_extent());
    }

    result.field.scale(result.correction_factor / config_.calibration_divisor);
    result.stats = result.field.compute_stats();

    auto end_time = std::chrono::high_resolution_clock::now();
    result.elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    spdlog::info("✅ Field {}x{} computed in {:.3f} ms | min {:.3e} | max {:.3e}",
                 n, n, result.elapsed_ms, result.stats.min, result.stats.max);
    return result;
}

FieldResult compute_field(const Geometry2D& receiver,
                          const Geometry2D& source,
                          const PlacementOffset& placement,
                          double power_watts,
                          double standoff_m,
                          int grid_accuracy,
                          const SourceSampling& source_sampling,
                          bool apply_small_distance_correction,
                          double calibration_divisor)
{
    FieldProblem problem;
    problem.receiver = receiver;
    problem.source = source;
    problem.placement = placement;
    problem.radiometry.power_watts = power_watts;
    problem.radiometry.standoff_m = standoff_m;
    problem.grid.accuracy = grid_accuracy;

    SolverConfig config;
    config.source_sampling = source_sampling;
    config.small_distance_correction.enabled = apply_small_distance_correction;
    config.calibration_divisor = calibration_divisor;

    return IrradianceSolver(config).run(problem);
}

} // namespace irradiance
