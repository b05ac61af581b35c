#include <iostream>
#include <iomanip>
#include <spdlog/spdlog.h>
#include "solver/irradiance_solver.h" // High-level solver API
#include "theory/theory.h"
#include "display/display_norm.h"

using namespace irradiance;

int main() {
    try {
        // --- Problem Configuration (单位: m, W) ---
        FieldProblem problem;
        problem.receiver = {100.0, 100.0};
        problem.source = {1.0, 1.0};
        problem.placement = {50.0, 50.0};   // source center
        problem.radiometry.power_watts = 500.0;
        problem.radiometry.standoff_m = 500.0;
        problem.grid.accuracy = 30;

        SolverConfig config;
        config.source_sampling = AdaptiveSampling{};
        config.execution = ExecutionPolicy::Parallel;

        spdlog::info("=== Test Configuration ===");
        spdlog::info("  Receiver: {} x {} m", problem.receiver.length, problem.receiver.height);
        spdlog::info("  Source: {} x {} m at ({}, {})", problem.source.length, problem.source.height,
                     problem.placement.x, problem.placement.y);
        spdlog::info("  Power: {} W", problem.radiometry.power_watts);
        spdlog::info("  Standoff: {} m", problem.radiometry.standoff_m);
        spdlog::info("  Accuracy: {} x {}", problem.grid.accuracy, problem.grid.accuracy);

        // --- 1. Calibrated field (display units) ---
        IrradianceSolver solver(config);
        FieldResult calibrated = solver.run(problem);

        // --- 2. Raw field in W/m² vs. analytic Lambertian rectangle ---
        IrradianceSolver raw_solver(SolverConfig::physical_units());
        FieldResult raw = raw_solver.run(problem);
        IrradianceField analytic = theory::TheoryCalculator::calculate_field(problem);
        double max_error = theory::TheoryCalculator::max_relative_error(raw.field, analytic);

        display::DisplayNorm norm = display::make_norm(calibrated.stats);

        // --- Print Results ---
        std::cout << "\n\n=== IRRADIANCE FIELD RESULTS ===\n";
        std::cout << std::scientific << std::setprecision(3);
        std::cout << "\nCalibrated (divisor " << calibrated.calibration_divisor << "):\n";
        std::cout << "  Min:            " << calibrated.stats.min << "\n";
        std::cout << "  Max:            " << calibrated.stats.max << "\n";
        std::cout << std::fixed << std::setprecision(4);
        std::cout << "  Max/Min ratio:  " << calibrated.stats.ratio << "\n";
        std::cout << std::setprecision(1);
        std::cout << "  Max at:         (" << calibrated.stats.max_x << ", " << calibrated.stats.max_y << ") m\n";
        std::cout << "  Source samples: " << calibrated.source_samples_per_axis << " x "
                  << calibrated.source_samples_per_axis << "\n";
        std::cout << std::setprecision(3);
        std::cout << "  Correction:     x" << calibrated.correction_factor << "\n";
        std::cout << "  Time:           " << calibrated.elapsed_ms << " ms\n";

        std::cout << std::scientific << std::setprecision(3);
        std::cout << "\nDisplay range (two-slope, vcenter " << norm.vcenter << "):\n";
        std::cout << "  vmin: " << norm.vmin << "  vmax: " << norm.vmax << "\n";

        std::cout << "\nRaw vs. Theory (W/m²):\n";
        std::cout << "  Numerical max:  " << raw.stats.max << "\n";
        std::cout << "  Analytic max:   " << analytic.compute_stats().max << "\n";
        std::cout << std::fixed << std::setprecision(3);
        std::cout << "  Max rel. error: " << max_error << " %\n";

        std::cout << "\n======================================\n" << std::endl;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error in main: {}", e.what());
        return 1;
    }

    return 0;
}
