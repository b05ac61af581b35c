#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>
#include <spdlog/common.h> // For spdlog::level::level_enum
#include <algorithm>

#include "solver/irradiance_solver.h"
#include "solver/solver_config.h"
#include "theory/theory.h"
#include "display/display_norm.h"
#include "errors.h"
#include "constants.h"
#include "logging.h"

namespace py = pybind11;
using namespace irradiance;
using namespace irradiance::theory;
using namespace irradiance::display;

namespace {

// Copies the field into a (rows, cols) float64 array; row = receiver Y, col = receiver X.
py::array_t<double> field_to_array(const IrradianceField& field) {
    py::array_t<double> out({field.rows(), field.cols()});
    std::copy(field.values().begin(), field.values().end(), out.mutable_data());
    return out;
}

} // namespace


PYBIND11_MODULE(_core, m) {
    m.doc() = "Irradiance Field - irradiance of a planar rectangular source on a parallel receiver";
    m.attr("__version__") = "0.1.0";

    // Bind spdlog::level::level_enum for Python control
    py::enum_<spdlog::level::level_enum>(m, "LogLevel", "Global logging levels for spdlog.")
        .value("TRACE", spdlog::level::trace)
        .value("DEBUG", spdlog::level::debug)
        .value("INFO", spdlog::level::info)
        .value("WARN", spdlog::level::warn)
        .value("ERROR", spdlog::level::err)
        .value("CRITICAL", spdlog::level::critical)
        .value("OFF", spdlog::level::off)
        .export_values();

    // Solver precondition errors surface as ValueError subclasses
    auto solver_error = py::register_exception<SolverError>(m, "SolverError", PyExc_ValueError);
    py::register_exception<InvalidGeometry>(m, "InvalidGeometry", solver_error.ptr());
    py::register_exception<InvalidGrid>(m, "InvalidGrid", solver_error.ptr());
    py::register_exception<InvalidDistance>(m, "InvalidDistance", solver_error.ptr());
    py::register_exception<InvalidPower>(m, "InvalidPower", solver_error.ptr());
    py::register_exception<InvalidCalibration>(m, "InvalidCalibration", solver_error.ptr());

    // Geometry and problem description
    py::class_<Geometry2D>(m, "Geometry2D")
        .def(py::init<>())
        .def(py::init([](double length, double height) { return Geometry2D{length, height}; }),
             py::arg("length"), py::arg("height"))
        .def_readwrite("length", &Geometry2D::length)
        .def_readwrite("height", &Geometry2D::height)
        .def("max_extent", &Geometry2D::max_extent)
        .def("area", &Geometry2D::area);

    py::class_<PlacementOffset>(m, "PlacementOffset")
        .def(py::init<>())
        .def(py::init([](double x, double y) { return PlacementOffset{x, y}; }),
             py::arg("x"), py::arg("y"), "Center of the source rectangle in the receiver frame (m).")
        .def_readwrite("x", &PlacementOffset::x)
        .def_readwrite("y", &PlacementOffset::y)
        .def_static("from_corner", &PlacementOffset::from_corner,
                    py::arg("corner_x"), py::arg("corner_y"), py::arg("source"),
                    "Converts a corner-anchored placement to the center convention.");

    py::class_<RadiometricSpec>(m, "RadiometricSpec")
        .def(py::init<>())
        .def_readwrite("power_watts", &RadiometricSpec::power_watts)
        .def_readwrite("standoff_m", &RadiometricSpec::standoff_m);

    py::class_<GridSpec>(m, "GridSpec")
        .def(py::init<>())
        .def_readwrite("accuracy", &GridSpec::accuracy);

    py::class_<FieldProblem>(m, "FieldProblem")
        .def(py::init<>())
        .def_readwrite("receiver", &FieldProblem::receiver)
        .def_readwrite("source", &FieldProblem::source)
        .def_readwrite("placement", &FieldProblem::placement)
        .def_readwrite("radiometry", &FieldProblem::radiometry)
        .def_readwrite("grid", &FieldProblem::grid);

    // Solver configuration
    py::class_<MatchReceiver>(m, "MatchReceiver")
        .def(py::init<>());

    py::class_<AdaptiveSampling>(m, "AdaptiveSampling")
        .def(py::init<>())
        .def_readwrite("divisor", &AdaptiveSampling::divisor)
        .def_readwrite("min_per_axis", &AdaptiveSampling::min_per_axis)
        .def_readwrite("max_per_axis", &AdaptiveSampling::max_per_axis);

    py::class_<FixedSampling>(m, "FixedSampling")
        .def(py::init<>())
        .def(py::init([](int per_axis) { return FixedSampling{per_axis}; }), py::arg("per_axis"))
        .def_readwrite("per_axis", &FixedSampling::per_axis);

    py::enum_<ExecutionPolicy>(m, "ExecutionPolicy")
        .value("Sequential", ExecutionPolicy::Sequential)
        .value("Parallel", ExecutionPolicy::Parallel);

    py::class_<SmallDistanceCorrection>(m, "SmallDistanceCorrection")
        .def(py::init<>())
        .def_readwrite("enabled", &SmallDistanceCorrection::enabled)
        .def_readwrite("threshold_factor", &SmallDistanceCorrection::threshold_factor)
        .def_readwrite("coefficient", &SmallDistanceCorrection::coefficient);

    py::class_<SolverConfig>(m, "SolverConfig")
        .def(py::init<>())
        .def_readwrite("source_sampling", &SolverConfig::source_sampling)
        .def_readwrite("small_distance_correction", &SolverConfig::small_distance_correction)
        .def_readwrite("calibration_divisor", &SolverConfig::calibration_divisor)
        .def_readwrite("execution", &SolverConfig::execution)
        .def_readwrite("num_threads", &SolverConfig::num_threads)
        .def_static("physical_units", &SolverConfig::physical_units,
                    "Configuration producing raw W/m^2 (no correction, divisor 1).");

    m.def("resolve_samples_per_axis", &resolve_samples_per_axis,
          py::arg("sampling"), py::arg("receiver_accuracy"));

    // Results
    py::class_<FieldStats>(m, "FieldStats")
        .def(py::init<>())
        .def_readonly("min", &FieldStats::min)
        .def_readonly("max", &FieldStats::max)
        .def_readonly("ratio", &FieldStats::ratio)
        .def_readonly("min_row", &FieldStats::min_row)
        .def_readonly("min_col", &FieldStats::min_col)
        .def_readonly("max_row", &FieldStats::max_row)
        .def_readonly("max_col", &FieldStats::max_col)
        .def_readonly("max_x", &FieldStats::max_x)
        .def_readonly("max_y", &FieldStats::max_y);

    py::class_<FieldResult>(m, "FieldResult")
        .def_property_readonly("field", [](const FieldResult& r) { return field_to_array(r.field); })
        .def_readonly("stats", &FieldResult::stats)
        .def_property_readonly("min", [](const FieldResult& r) { return r.stats.min; })
        .def_property_readonly("max", [](const FieldResult& r) { return r.stats.max; })
        .def_readonly("source_samples_per_axis", &FieldResult::source_samples_per_axis)
        .def_readonly("correction_factor", &FieldResult::correction_factor)
        .def_readonly("calibration_divisor", &FieldResult::calibration_divisor)
        .def_readonly("elapsed_ms", &FieldResult::elapsed_ms);

    // The solver
    py::class_<IrradianceSolver>(m, "IrradianceSolver")
        .def(py::init<const SolverConfig&>(), py::arg("config") = SolverConfig(),
             "Creates a solver with the given configuration.")
        .def("run", &IrradianceSolver::run, py::arg("problem"),
             py::call_guard<py::gil_scoped_release>(),
             "Computes the irradiance field for the given problem.")
        .def_property_readonly("config", &IrradianceSolver::config);

    m.def("compute_field", &compute_field,
          py::arg("receiver"), py::arg("source"), py::arg("placement"),
          py::arg("power_watts"), py::arg("standoff_m"), py::arg("grid_accuracy"),
          py::arg("source_sampling") = SourceSampling(AdaptiveSampling{}),
          py::arg("apply_small_distance_correction") = true,
          py::arg("calibration_divisor") = 0.005,
          py::call_guard<py::gil_scoped_release>(),
          "One-shot irradiance field computation.");

    // Theory
    py::class_<LambertianRectangle>(m, "LambertianRectangle")
        .def(py::init<const Geometry2D&, const PlacementOffset&, double>(),
             py::arg("size"), py::arg("center"), py::arg("power"))
        .def("get_exitance", &LambertianRectangle::get_exitance)
        .def("get_power", &LambertianRectangle::get_power);

    py::class_<TheoryCalculator>(m, "TheoryCalculator")
        .def_static("irradiance_at", &TheoryCalculator::irradiance_at,
                    py::arg("source"), py::arg("x"), py::arg("y"), py::arg("standoff"))
        .def_static("point_source_irradiance", &TheoryCalculator::point_source_irradiance,
                    py::arg("power"), py::arg("standoff"))
        .def_static("calculate_field",
                    [](const FieldProblem& p) { return field_to_array(TheoryCalculator::calculate_field(p)); },
                    py::arg("problem"),
                    "Analytic field in raw W/m^2 on the solver's grid.")
        .def_static("calculate_relative_error", &TheoryCalculator::calculate_relative_error,
                    py::arg("numerical"), py::arg("analytic"));

    // Display normalization
    py::enum_<NormType>(m, "NormType")
        .value("TwoSlope", NormType::TwoSlope)
        .value("Linear", NormType::Linear)
        .value("Log", NormType::Log)
        .value("Power", NormType::Power);

    py::class_<DisplayNorm>(m, "DisplayNorm")
        .def_readonly("type", &DisplayNorm::type)
        .def_readonly("vmin", &DisplayNorm::vmin)
        .def_readonly("vcenter", &DisplayNorm::vcenter)
        .def_readonly("vmax", &DisplayNorm::vmax)
        .def_readonly("gamma", &DisplayNorm::gamma)
        .def("map", &DisplayNorm::map, py::arg("value"));

    m.def("make_norm", &make_norm,
          py::arg("stats"), py::arg("type") = NormType::TwoSlope,
          py::arg("gamma") = 0.5, py::arg("vcenter") = 1.0);

    // Bind the set_log_level function
    m.def("set_log_level", &set_log_level,
          py::arg("level"),
          "Sets the global logging level. Use LogLevel enum (e.g., irf.LogLevel.INFO).");

    // 常量
    m.attr("PI") = PI;
}
