/**
 * @file bindings.cpp
 * @brief Python bindings for ilm using pybind11
 *
 * Provides Python interface for:
 * - Grid and circle surface construction
 * - The Dirichlet heat conduction problem
 * - The constrained integrator (stepping, state as NumPy arrays)
 * - Configuration files
 */

#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>
#include <pybind11/functional.h>

#include "ilm/ilm.hpp"
#include <cstring>

namespace py = pybind11;
using namespace ilm;

// ============================================================================
// Helper Functions
// ============================================================================

/// Convert Eigen Vector to NumPy array
py::array_t<double> vector_to_numpy(const Vector& vec) {
    return py::array_t<double>(vec.size(), vec.data());
}

/// Convert NumPy array to Eigen Vector
Vector numpy_to_vector(py::array_t<double, py::array::c_style | py::array::forcecast> arr) {
    py::buffer_info buf = arr.request();
    Vector vec(buf.size);
    std::memcpy(vec.data(), buf.ptr, buf.size * sizeof(double));
    return vec;
}

/// Grid field as an (ny, nx) array
py::array_t<double> grid_to_numpy(const CartesianGrid& grid, const GridField& field) {
    if (field.n_components() != 1) {
        return vector_to_numpy(field.values());
    }
    py::array_t<double> out(std::vector<py::ssize_t>{grid.ny(), grid.nx()});
    std::memcpy(out.mutable_data(), field.values().data(), field.size() * sizeof(double));
    return out;
}

// ============================================================================
// Python Module Definition
// ============================================================================

PYBIND11_MODULE(ilm_py, m) {
    m.doc() = R"pbdoc(
        ilm: immersed-layer constrained ODE toolkit
        ===========================================

        Grid PDEs with an immersed Dirichlet surface, advanced with
        integrating-factor half-explicit Runge-Kutta schemes.

        Example:
            >>> import ilm_py as ilm
            >>> g = ilm.CartesianGrid((-2.0, 2.0), (-2.0, 2.0), 0.02)
            >>> body = ilm.Surface.circle(1.0, 1.4 * g.cell_size())
            >>> prob = ilm.DirichletHeatConduction(g, body, ilm.HeatConductionParameters(), 0.0, 1.0)
            >>> integ = prob.integrator((0.0, 1.0))
            >>> integ.advance(100 * integ.dt())
            >>> T = integ.temperature(g)
    )pbdoc";

    // ========================================================================
    // Errors
    // ========================================================================

    auto base_error = py::register_exception<Error>(m, "Error");
    py::register_exception<ConfigurationError>(m, "ConfigurationError", base_error.ptr());
    py::register_exception<NumericalDivergence>(m, "NumericalDivergence", base_error.ptr());
    py::register_exception<SingularSystem>(m, "SingularSystem", base_error.ptr());

    // ========================================================================
    // Enums
    // ========================================================================

    py::enum_<TimeMarchingScheme>(m, "TimeMarchingScheme")
        .value("IFHEEuler", TimeMarchingScheme::IFHEEuler)
        .value("LiskaIFHERK", TimeMarchingScheme::LiskaIFHERK)
        .export_values();

    py::enum_<SchurSolveMethod>(m, "SchurSolveMethod")
        .value("Auto", SchurSolveMethod::Auto)
        .value("Direct", SchurSolveMethod::Direct)
        .value("ConjugateGradient", SchurSolveMethod::ConjugateGradient)
        .export_values();

    py::enum_<IntegratorStatus>(m, "IntegratorStatus")
        .value("Uninitialized", IntegratorStatus::Uninitialized)
        .value("Ready", IntegratorStatus::Ready)
        .value("Stepping", IntegratorStatus::Stepping)
        .value("Finished", IntegratorStatus::Finished)
        .value("Failed", IntegratorStatus::Failed)
        .export_values();

    // ========================================================================
    // Result Types
    // ========================================================================

    py::class_<SolveResult>(m, "SolveResult")
        .def_readonly("converged", &SolveResult::converged)
        .def_readonly("iterations", &SolveResult::iterations)
        .def_readonly("final_residual", &SolveResult::final_residual)
        .def_readonly("solve_time_ms", &SolveResult::solve_time_ms)
        .def_readonly("message", &SolveResult::message)
        .def("__repr__", [](const SolveResult& r) {
            return "<SolveResult converged=" + std::to_string(r.converged) +
                   " iterations=" + std::to_string(r.iterations) + ">";
        });

    py::class_<StepResult>(m, "StepResult")
        .def_readonly("success", &StepResult::success)
        .def_readonly("steps_taken", &StepResult::steps_taken)
        .def_readonly("time", &StepResult::time)
        .def_readonly("schur_iterations", &StepResult::schur_iterations)
        .def_readonly("last_residual", &StepResult::last_residual)
        .def_readonly("message", &StepResult::message);

    // ========================================================================
    // Configuration
    // ========================================================================

    py::class_<IntegratorConfig>(m, "IntegratorConfig")
        .def(py::init<>())
        .def_readwrite("scheme", &IntegratorConfig::scheme)
        .def_readwrite("dt", &IntegratorConfig::dt)
        .def_readwrite("verbose", &IntegratorConfig::verbose);

    py::class_<SchurConfig>(m, "SchurConfig")
        .def(py::init<>())
        .def_readwrite("method", &SchurConfig::method)
        .def_readwrite("dense_threshold", &SchurConfig::dense_threshold)
        .def_readwrite("max_iterations", &SchurConfig::max_iterations)
        .def_readwrite("tolerance", &SchurConfig::tolerance)
        .def_readwrite("verbose", &SchurConfig::verbose);

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_static("from_file", [](const std::string& path) { return Config::from_file(path); })
        .def("to_file", [](const Config& self, const std::string& path) { self.to_file(path); })
        .def("validate", &Config::validate)
        .def_readwrite("integrator", &Config::integrator)
        .def_readwrite("schur", &Config::schur);

    // ========================================================================
    // Geometry
    // ========================================================================

    py::class_<CartesianGrid>(m, "CartesianGrid")
        .def(py::init<std::pair<Real, Real>, std::pair<Real, Real>, Real>(),
             py::arg("xlim"), py::arg("ylim"), py::arg("dx"))
        .def("nx", &CartesianGrid::nx)
        .def("ny", &CartesianGrid::ny)
        .def("n_points", &CartesianGrid::n_points)
        .def("cell_size", &CartesianGrid::cell_size)
        .def("x", [](const CartesianGrid& g) {
            Vector x(g.nx());
            for (Index i = 0; i < g.nx(); ++i) x(i) = g.x(i);
            return vector_to_numpy(x);
        })
        .def("y", [](const CartesianGrid& g) {
            Vector y(g.ny());
            for (Index j = 0; j < g.ny(); ++j) y(j) = g.y(j);
            return vector_to_numpy(y);
        });

    py::class_<Surface>(m, "Surface")
        .def_static("circle", [](Real radius, Real ds) { return Surface::circle(radius, ds); },
                    py::arg("radius"), py::arg("ds"))
        .def("n_points", &Surface::n_points)
        .def("length", &Surface::length)
        .def("ds", [](const Surface& s) { return vector_to_numpy(s.ds()); });

    // ========================================================================
    // Heat conduction problem
    // ========================================================================

    py::class_<HeatConductionParameters>(m, "HeatConductionParameters")
        .def(py::init<>())
        .def_readwrite("diffusivity", &HeatConductionParameters::diffusivity)
        .def_readwrite("fourier", &HeatConductionParameters::fourier);

    m.def("timestep_fourier", &timestep_fourier, py::arg("grid"), py::arg("params"));

    py::class_<DirichletHeatConduction>(m, "DirichletHeatConduction")
        .def(py::init([](const CartesianGrid& grid, const Surface& surface,
                         const HeatConductionParameters& params,
                         Real exterior, Real interior) {
                 return std::make_unique<DirichletHeatConduction>(
                     grid, surface, params, HeatBoundaryData::constant(exterior, interior));
             }),
             py::arg("grid"), py::arg("surface"), py::arg("params"),
             py::arg("exterior_temperature"), py::arg("interior_temperature"))
        .def("timestep", &DirichletHeatConduction::timestep)
        .def("integrator",
             [](const DirichletHeatConduction& self, std::pair<Real, Real> tspan,
                const IntegratorConfig& config, const SchurConfig& schur) {
                 return std::make_unique<Integrator>(self.solution_prototype(), tspan,
                                                     self.ode_function(), self.timestep(),
                                                     config, schur);
             },
             py::arg("tspan"), py::arg("config") = IntegratorConfig{},
             py::arg("schur") = SchurConfig{},
             py::keep_alive<0, 1>());

    // ========================================================================
    // Integrator
    // ========================================================================

    py::class_<Integrator>(m, "Integrator")
        .def("step", &Integrator::step)
        .def("advance", &Integrator::advance, py::arg("duration"))
        .def("advance_steps", &Integrator::advance_steps, py::arg("n"))
        .def("advance_to", &Integrator::advance_to, py::arg("target"))
        .def("set_dt", &Integrator::set_dt)
        .def("reinit", [](Integrator& self, py::array_t<double> state) {
            CoupledState u0 = CoupledState::zeros_like(self.function().prototype());
            Vector values = numpy_to_vector(state);
            if (values.size() != u0.state.size()) {
                throw ConfigurationError("reinit: state array has the wrong size");
            }
            u0.state.values() = values;
            self.reinit(u0);
        }, py::arg("state"))
        .def("time", &Integrator::time)
        .def("dt", &Integrator::dt)
        .def("status", &Integrator::status)
        .def("steps_taken", &Integrator::steps_taken)
        .def("last_step", &Integrator::last_step)
        .def("state", [](const Integrator& self) {
            return vector_to_numpy(self.state().state.values());
        })
        .def("multiplier", [](const Integrator& self) {
            return vector_to_numpy(self.state().constraint.values());
        })
        .def("temperature", [](const Integrator& self, const CartesianGrid& grid) {
            return grid_to_numpy(grid, self.state().state);
        }, py::arg("grid"));
}
