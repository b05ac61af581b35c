#pragma once

#include "geometry/geometry_types.h"
#include "field/field_result.h"
#include "solver/solver_config.h"

namespace irradiance {

/**
 * @brief Irradiance field of a planar rectangular Lambertian source on a
 *        parallel planar rectangular receiver.
 *
 * The source is split into S x S equal-power point emitters of radiant
 * intensity I = P / (S^2 * pi); each one contributes I * cos^2(a) / r^2 to
 * every receiver grid point. The sum is then optionally boosted by the
 * near-field correction and divided by the calibration divisor.
 *
 * The solver holds only its configuration. run() is const and may be called
 * concurrently from several threads.
 */
class IrradianceSolver {
public:
    explicit IrradianceSolver(const SolverConfig& config = SolverConfig());

    /**
     * @brief Computes the field for one problem.
     * @throws InvalidGeometry, InvalidGrid, InvalidDistance, InvalidPower,
     *         InvalidCalibration on precondition violations.
     */
    FieldResult run(const FieldProblem& problem) const;

    const SolverConfig& config() const { return config_; }

    /**
     * @brief Checks every precondition of run() without computing anything.
     */
    static void validate(const FieldProblem& problem, const SolverConfig& config);

    /**
     * @brief Multiplier applied by the near-field correction (1.0 when it does not trigger).
     */
    static double small_distance_factor(const FieldProblem& problem,
                                        const SmallDistanceCorrection& correction);

private:
    SolverConfig config_;
};

/**
 * @brief One-shot convenience wrapper around IrradianceSolver.
 *
 * Uses the parallel execution policy and the default correction constants;
 * only the switches named in the signature are taken from the caller.
 */
FieldResult compute_field(const Geometry2D& receiver,
                          const Geometry2D& source,
                          const PlacementOffset& placement,
                          double power_watts,
                          double standoff_m,
                          int grid_accuracy,
                          const SourceSampling& source_sampling,
                          bool apply_small_distance_correction,
                          double calibration_divisor);

} // namespace irradiance
