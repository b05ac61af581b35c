#include <gtest/gtest.h>
#include "solver/irradiance_solver.h"
#include "solver/solver_config.h"
#include "theory/theory.h"
#include "errors.h"
#include "constants.h"
#include <cmath>
#include <limits>

using namespace irradiance;

namespace {

// 原始物理单位 (W/m²)，顺序累加，结果可逐位复现
SolverConfig raw_config(SourceSampling sampling = FixedSampling{1}) {
    SolverConfig config = SolverConfig::physical_units();
    config.source_sampling = sampling;
    config.execution = ExecutionPolicy::Sequential;
    return config;
}

FieldProblem square_problem(double receiver_side, double source_side, double standoff, int accuracy) {
    FieldProblem problem;
    problem.receiver = {receiver_side, receiver_side};
    problem.source = {source_side, source_side};
    problem.placement = {0.5 * receiver_side, 0.5 * receiver_side};
    problem.radiometry.power_watts = 100.0;
    problem.radiometry.standoff_m = standoff;
    problem.grid.accuracy = accuracy;
    return problem;
}

} // namespace

// 输出网格形状始终为 accuracy x accuracy
TEST(IrradianceSolverTest, FieldShapeMatchesAccuracy) {
    IrradianceSolver solver(raw_config(AdaptiveSampling{}));
    for (int accuracy : {2, 7, 30}) {
        FieldProblem problem = square_problem(10.0, 1.0, 5.0, accuracy);
        FieldResult result = solver.run(problem);
        EXPECT_EQ(result.field.rows(), accuracy);
        EXPECT_EQ(result.field.cols(), accuracy);
        EXPECT_EQ(result.field.size(), static_cast<size_t>(accuracy * accuracy));
    }
}

// 所有网格值非负且有限
TEST(IrradianceSolverTest, NonNegativeAndFinite) {
    IrradianceSolver solver;  // default config: adaptive, corrected, calibrated, parallel
    const double standoffs[] = {0.01, 1.0, 30.0, 1000.0};
    for (double standoff : standoffs) {
        FieldProblem problem = square_problem(50.0, 3.0, standoff, 12);
        problem.placement = {-20.0, 70.0};  // source partly off the receiver
        FieldResult result = solver.run(problem);
        for (double v : result.field.values()) {
            EXPECT_GE(v, 0.0);
            EXPECT_TRUE(std::isfinite(v));
        }
    }
}

// 点光源正下方: E = I / L² (cos α = 1)
TEST(IrradianceSolverTest, InverseSquareLimitDirectlyBelowPointSource) {
    FieldProblem problem;
    problem.receiver = {10.0, 10.0};
    problem.source = {0.5, 0.5};
    problem.placement = {3.0, 4.0};
    problem.radiometry.power_watts = 40.0;
    problem.radiometry.standoff_m = 2.0;
    problem.grid.accuracy = 11;  // 1 m spacing, grid points land on integers

    FieldResult result = IrradianceSolver(raw_config(FixedSampling{1})).run(problem);

    double intensity = problem.radiometry.power_watts * INV_PI;
    double expected = intensity / (problem.radiometry.standoff_m * problem.radiometry.standoff_m);

    EXPECT_DOUBLE_EQ(result.field.at(4, 3), expected);
    EXPECT_DOUBLE_EQ(result.field.at(4, 3),
                     theory::TheoryCalculator::point_source_irradiance(40.0, 2.0));
    EXPECT_EQ(result.stats.max_row, 4);
    EXPECT_EQ(result.stats.max_col, 3);
}

// 功率翻倍，每个网格值精确翻倍
TEST(IrradianceSolverTest, LinearInPower) {
    FieldProblem problem = square_problem(40.0, 4.0, 15.0, 9);
    problem.placement = {12.0, 25.0};
    IrradianceSolver solver(raw_config(FixedSampling{6}));

    FieldResult single = solver.run(problem);
    problem.radiometry.power_watts *= 2.0;
    FieldResult doubled = solver.run(problem);

    for (size_t i = 0; i < single.field.size(); ++i) {
        EXPECT_DOUBLE_EQ(doubled.field.values()[i], 2.0 * single.field.values()[i]);
    }
}

// 居中的正方形光源 + 正方形接收面: 场绕中心旋转90度不变
TEST(IrradianceSolverTest, SymmetricUnderQuarterTurn) {
    FieldProblem problem = square_problem(20.0, 2.0, 6.0, 21);
    FieldResult result = IrradianceSolver(raw_config(FixedSampling{5})).run(problem);

    const int n = problem.grid.accuracy;
    const double tol = 1e-12 * result.stats.max;
    for (int row = 0; row < n; ++row) {
        for (int col = 0; col < n; ++col) {
            EXPECT_NEAR(result.field.at(row, col), result.field.at(col, n - 1 - row), tol);
        }
    }
}

// 点光源: 离投影中心越远，辐照度越低
TEST(IrradianceSolverTest, MonotonicFalloffFromPointSource) {
    FieldProblem problem = square_problem(20.0, 0.1, 5.0, 21);
    FieldResult result = IrradianceSolver(raw_config(FixedSampling{1})).run(problem);

    const int center = 10;
    for (int col = center; col + 1 < problem.grid.accuracy; ++col) {
        EXPECT_GE(result.field.at(center, col), result.field.at(center, col + 1));
    }
    for (int k = center; k + 1 < problem.grid.accuracy; ++k) {
        EXPECT_GE(result.field.at(k, k), result.field.at(k + 1, k + 1));
        EXPECT_GT(result.field.at(center, k), result.field.at(k + 1, k + 1));
    }
    EXPECT_EQ(result.stats.max_row, center);
    EXPECT_EQ(result.stats.max_col, center);
}

// 参考场景: 100x100 m 接收面, 1x1 m 光源位于 (50, 50), 500 m, 500 W, accuracy 30
TEST(IrradianceSolverTest, ReferenceScenario) {
    FieldProblem problem;  // defaults are the reference configuration
    ASSERT_EQ(problem.grid.accuracy, 30);

    FieldResult result = IrradianceSolver().run(problem);

    // Grid points nearest to 50 m are indices 14 and 15 (48.28 m and 51.72 m)
    EXPECT_TRUE(result.stats.max_row == 14 || result.stats.max_row == 15);
    EXPECT_TRUE(result.stats.max_col == 14 || result.stats.max_col == 15);

    EXPECT_TRUE(result.stats.min_row == 0 || result.stats.min_row == 29);
    EXPECT_TRUE(result.stats.min_col == 0 || result.stats.min_col == 29);
    EXPECT_NEAR(result.stats.min, result.field.at(0, 0), 1e-12 * result.stats.min);

    EXPECT_GT(result.stats.ratio, 1.0);
    EXPECT_EQ(result.source_samples_per_axis, 3);     // clamp(30 / 10, 2, 10)
    EXPECT_DOUBLE_EQ(result.correction_factor, 1.0);  // 500 m >> 10 x 1 m
    EXPECT_DOUBLE_EQ(result.calibration_divisor, 0.005);
}

// 距离远大于接收面尺寸时场趋于均匀
TEST(IrradianceSolverTest, FarFieldBecomesUniform) {
    IrradianceSolver solver(raw_config(AdaptiveSampling{}));

    FieldProblem near_problem = square_problem(10.0, 1.0, 20.0, 10);
    FieldProblem far_problem = square_problem(10.0, 1.0, 1.0e5, 10);

    FieldResult near_result = solver.run(near_problem);
    FieldResult far_result = solver.run(far_problem);

    EXPECT_LT(far_result.stats.ratio, 1.0 + 1e-6);
    EXPECT_GE(far_result.stats.ratio, 1.0);
    EXPECT_GT(near_result.stats.ratio, far_result.stats.ratio);
}

// 顺序与并行累加结果一致
TEST(IrradianceSolverTest, SequentialAndParallelAgree) {
    FieldProblem problem = square_problem(30.0, 6.0, 8.0, 25);
    problem.placement = {11.0, 17.0};

    SolverConfig sequential = raw_config(MatchReceiver{});
    SolverConfig parallel = sequential;
    parallel.execution = ExecutionPolicy::Parallel;
    parallel.num_threads = 4;

    FieldResult a = IrradianceSolver(sequential).run(problem);
    FieldResult b = IrradianceSolver(parallel).run(problem);

    ASSERT_EQ(a.field.size(), b.field.size());
    for (size_t i = 0; i < a.field.size(); ++i) {
        EXPECT_NEAR(a.field.values()[i], b.field.values()[i], 1e-12 * a.field.values()[i]);
    }
}

TEST(IrradianceSolverTest, ResolvesSourceSampleCount) {
    EXPECT_EQ(resolve_samples_per_axis(AdaptiveSampling{}, 5), 2);
    EXPECT_EQ(resolve_samples_per_axis(AdaptiveSampling{}, 30), 3);
    EXPECT_EQ(resolve_samples_per_axis(AdaptiveSampling{}, 100), 10);
    EXPECT_EQ(resolve_samples_per_axis(AdaptiveSampling{}, 250), 10);
    EXPECT_EQ(resolve_samples_per_axis(MatchReceiver{}, 17), 17);
    EXPECT_EQ(resolve_samples_per_axis(FixedSampling{4}, 17), 4);

    AdaptiveSampling wider;
    wider.divisor = 5;
    wider.max_per_axis = 40;
    EXPECT_EQ(resolve_samples_per_axis(wider, 100), 20);

    EXPECT_THROW(resolve_samples_per_axis(FixedSampling{0}, 10), InvalidGrid);
    AdaptiveSampling inverted;
    inverted.min_per_axis = 3;
    inverted.max_per_axis = 2;
    EXPECT_THROW(resolve_samples_per_axis(inverted, 10), InvalidGrid);
}

// 小距离修正: L < 10 * max(l_s, h_s) 时乘以 1 + 0.1 * max(l_s, h_s) / L
TEST(IrradianceSolverTest, SmallDistanceCorrection) {
    FieldProblem problem = square_problem(40.0, 10.0, 50.0, 8);
    SmallDistanceCorrection correction;

    EXPECT_DOUBLE_EQ(IrradianceSolver::small_distance_factor(problem, correction), 1.0 + 0.1 * (10.0 / 50.0));

    SolverConfig corrected = raw_config(FixedSampling{4});
    corrected.small_distance_correction.enabled = true;
    FieldResult boosted = IrradianceSolver(corrected).run(problem);
    FieldResult plain = IrradianceSolver(raw_config(FixedSampling{4})).run(problem);

    EXPECT_DOUBLE_EQ(boosted.correction_factor, 1.02);
    EXPECT_DOUBLE_EQ(plain.correction_factor, 1.0);
    for (size_t i = 0; i < plain.field.size(); ++i) {
        EXPECT_NEAR(boosted.field.values()[i], 1.02 * plain.field.values()[i], 1e-12 * boosted.field.values()[i]);
    }

    // 阈值处 (L == 10 * 10 m) 不修正
    problem.radiometry.standoff_m = 100.0;
    EXPECT_DOUBLE_EQ(IrradianceSolver::small_distance_factor(problem, correction), 1.0);

    correction.enabled = false;
    problem.radiometry.standoff_m = 1.0;
    EXPECT_DOUBLE_EQ(IrradianceSolver::small_distance_factor(problem, correction), 1.0);
}

// 标定除数: 结果整体除以 divisor
TEST(IrradianceSolverTest, CalibrationDivisorScalesField) {
    FieldProblem problem = square_problem(10.0, 1.0, 10.0, 6);
    problem.radiometry.power_watts = 10.0;

    SolverConfig calibrated = raw_config(FixedSampling{3});
    calibrated.calibration_divisor = 0.005;

    FieldResult raw = IrradianceSolver(raw_config(FixedSampling{3})).run(problem);
    FieldResult scaled = IrradianceSolver(calibrated).run(problem);

    for (size_t i = 0; i < raw.field.size(); ++i) {
        EXPECT_NEAR(scaled.field.values()[i], raw.field.values()[i] / 0.005, 1e-12 * scaled.field.values()[i]);
    }
    EXPECT_NEAR(scaled.stats.max, raw.stats.max * 200.0, 1e-12 * scaled.stats.max);
}

TEST(IrradianceSolverTest, ZeroPowerGivesZeroField) {
    FieldProblem problem = square_problem(10.0, 1.0, 3.0, 5);
    problem.radiometry.power_watts = 0.0;

    FieldResult result = IrradianceSolver().run(problem);
    for (double v : result.field.values()) {
        EXPECT_EQ(v, 0.0);
    }
    EXPECT_EQ(result.stats.max, 0.0);
    EXPECT_EQ(result.stats.ratio, 0.0);
}

TEST(IrradianceSolverTest, RejectsInvalidInput) {
    IrradianceSolver solver;

    FieldProblem p = square_problem(10.0, 1.0, 5.0, 5);
    p.receiver.length = 0.0;
    EXPECT_THROW(solver.run(p), InvalidGeometry);

    p = square_problem(10.0, 1.0, 5.0, 5);
    p.source.height = -1.0;
    EXPECT_THROW(solver.run(p), InvalidGeometry);

    p = square_problem(10.0, 1.0, 5.0, 5);
    p.placement.x = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(solver.run(p), InvalidGeometry);

    p = square_problem(10.0, 1.0, 5.0, 1);
    EXPECT_THROW(solver.run(p), InvalidGrid);

    p = square_problem(10.0, 1.0, 0.0, 5);
    EXPECT_THROW(solver.run(p), InvalidDistance);

    p = square_problem(10.0, 1.0, -3.0, 5);
    EXPECT_THROW(solver.run(p), InvalidDistance);

    p = square_problem(10.0, 1.0, std::numeric_limits<double>::quiet_NaN(), 5);
    EXPECT_THROW(solver.run(p), InvalidDistance);

    p = square_problem(10.0, 1.0, std::numeric_limits<double>::infinity(), 5);
    EXPECT_THROW(solver.run(p), InvalidDistance);

    // L² 下溢为 0
    p = square_problem(10.0, 1.0, 1e-200, 5);
    EXPECT_THROW(solver.run(p), InvalidDistance);

    p = square_problem(10.0, 1.0, 5.0, 5);
    p.radiometry.power_watts = -1.0;
    EXPECT_THROW(solver.run(p), InvalidPower);

    p.radiometry.power_watts = std::numeric_limits<double>::infinity();
    EXPECT_THROW(solver.run(p), InvalidPower);

    SolverConfig bad = SolverConfig();
    bad.calibration_divisor = 0.0;
    p = square_problem(10.0, 1.0, 5.0, 5);
    EXPECT_THROW(IrradianceSolver(bad).run(p), InvalidCalibration);

    bad = SolverConfig();
    bad.small_distance_correction.coefficient = -0.1;
    EXPECT_THROW(IrradianceSolver(bad).run(p), InvalidCalibration);

    bad = SolverConfig();
    bad.small_distance_correction.threshold_factor = -1.0;
    EXPECT_THROW(IrradianceSolver(bad).run(p), InvalidCalibration);

    bad = SolverConfig();
    bad.num_threads = -2;
    EXPECT_THROW(IrradianceSolver(bad).run(p), InvalidGrid);

    // 所有错误都是 SolverError / std::invalid_argument
    p.grid.accuracy = 0;
    EXPECT_THROW(solver.run(p), SolverError);
    EXPECT_THROW(solver.run(p), std::invalid_argument);
}

// 极大距离时 L² 溢出, 场应退化为有限的 0 而不是 NaN
TEST(IrradianceSolverTest, HugeStandoffStaysFinite) {
    FieldProblem problem;
    problem.radiometry.standoff_m = 1e160;

    for (ExecutionPolicy policy : {ExecutionPolicy::Sequential, ExecutionPolicy::Parallel}) {
        SolverConfig config;
        config.execution = policy;
        FieldResult result = IrradianceSolver(config).run(problem);

        for (double v : result.field.values()) {
            EXPECT_TRUE(std::isfinite(v));
            EXPECT_GE(v, 0.0);
        }
        EXPECT_TRUE(std::isfinite(result.stats.min));
        EXPECT_TRUE(std::isfinite(result.stats.max));
    }
}

TEST(IrradianceSolverTest, ExplicitThreadCount) {
    FieldProblem problem = square_problem(20.0, 4.0, 6.0, 12);
    SolverConfig config = raw_config(FixedSampling{5});
    FieldResult sequential = IrradianceSolver(config).run(problem);

    config.execution = ExecutionPolicy::Parallel;
    config.num_threads = 2;
    FieldResult parallel = IrradianceSolver(config).run(problem);

    for (size_t i = 0; i < sequential.field.size(); ++i) {
        EXPECT_NEAR(parallel.field.values()[i], sequential.field.values()[i],
                    1e-12 * sequential.field.values()[i]);
    }
}

TEST(IrradianceSolverTest, ComputeFieldMatchesSolver) {
    FieldProblem problem = square_problem(25.0, 2.0, 12.0, 10);

    FieldResult direct = compute_field(problem.receiver, problem.source, problem.placement,
                                       problem.radiometry.power_watts, problem.radiometry.standoff_m,
                                       problem.grid.accuracy, FixedSampling{4}, false, 1.0);

    SolverConfig config = SolverConfig::physical_units();
    config.source_sampling = FixedSampling{4};
    FieldResult via_solver = IrradianceSolver(config).run(problem);

    EXPECT_NEAR(direct.stats.min, via_solver.stats.min, 1e-12 * direct.stats.min);
    EXPECT_NEAR(direct.stats.max, via_solver.stats.max, 1e-12 * direct.stats.max);
    EXPECT_EQ(direct.source_samples_per_axis, 4);
}

TEST(IrradianceSolverTest, CornerPlacementConvertsToCenter) {
    Geometry2D source = {1.0, 3.0};
    PlacementOffset center = PlacementOffset::from_corner(49.5, 48.5, source);
    EXPECT_DOUBLE_EQ(center.x, 50.0);
    EXPECT_DOUBLE_EQ(center.y, 50.0);
}
