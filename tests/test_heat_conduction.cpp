/**
 * @file test_heat_conduction.cpp
 * @brief Heat conduction into a disk held at constant temperature
 *
 * Coarse version of the unit-circle case: dx = 0.2 on [-2, 2]^2,
 * surface spacing 1.4 dx, Fourier number 0.25.
 *
 * Inside the disk the temperature rises monotonically towards the surface
 * value but overshoots it by O(dx): about 5.5% at dx = 0.2 and 2.6% at
 * dx = 0.1 by t = 1, for any dt.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "ilm/ilm.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

using namespace ilm;
using Catch::Approx;

namespace {

constexpr Real DX = 0.2;
constexpr Real RADIUS = 1.0;

UniquePtr<DirichletHeatConduction> make_problem(Real exterior, Real interior, Real dx = DX) {
    CartesianGrid grid({-2.0, 2.0}, {-2.0, 2.0}, dx);
    Surface body = Surface::circle(RADIUS, 1.4 * dx);
    ConstraintConfig cc;
    cc.check_adjoint = true;
    return std::make_unique<DirichletHeatConduction>(
        grid, body, HeatConductionParameters{}, HeatBoundaryData::constant(exterior, interior),
        KrylovConfig{}, cc);
}

std::vector<Index> points_within(const CartesianGrid& grid, Real r) {
    std::vector<Index> out;
    for (Index j = 0; j < grid.ny(); ++j) {
        for (Index i = 0; i < grid.nx(); ++i) {
            if (std::hypot(grid.x(i), grid.y(j)) <= r) {
                out.push_back(grid.index(i, j));
            }
        }
    }
    return out;
}

/// Largest temperature inside r <= 0.6 over a run of the disk case to t = 1
Real interior_peak(Real dx) {
    auto problem = make_problem(1.0, 1.0, dx);
    Integrator integ(problem->solution_prototype(), {0.0, 1.0}, problem->ode_function(),
                     problem->timestep());
    const std::vector<Index> interior = points_within(problem->grid(), 0.6);

    Real peak = 0.0;
    integ.set_output_callback([&](const Integrator& it) {
        for (Index p : interior) {
            peak = std::max(peak, it.state().state(p));
        }
    });
    REQUIRE(integ.advance_to(1.0).success);
    REQUIRE(integ.status() == IntegratorStatus::Finished);
    return peak;
}

} // namespace

TEST_CASE("Fourier time step", "[heat]") {
    CartesianGrid grid({-2.0, 2.0}, {-2.0, 2.0}, DX);
    HeatConductionParameters params;
    REQUIRE(timestep_fourier(grid, params) == Approx(0.01));

    params.diffusivity = 2.0;
    params.fourier = 0.5;
    REQUIRE(timestep_fourier(grid, params) == Approx(0.01));

    params.diffusivity = 0.0;
    REQUIRE_THROWS_AS(timestep_fourier(grid, params), ConfigurationError);
}

TEST_CASE("Heat conduction operators are consistent", "[heat]") {
    auto problem = make_problem(0.0, 1.0);
    const ConstrainedODEFunction& f = *problem->ode_function();

    REQUIRE(f.n_state() == 400);
    REQUIRE(f.n_constraint() == problem->surface().n_points());
    REQUIRE(f.check_adjoint() <= 1e-12);
    REQUIRE(problem->timestep() == Approx(0.01));
    REQUIRE(problem->laplacian_operator().scale() == 1.0);

    SECTION("constraint target is the mean of the two sides") {
        SurfaceField target = problem->surface().zeros_surface();
        f.constraint_rhs(target, 0.0);
        for (Index k = 0; k < target.size(); ++k) {
            REQUIRE(target(k) == Approx(0.5));
        }
    }

    SECTION("the double-layer source vanishes without a jump") {
        auto continuous = make_problem(1.0, 1.0);
        GridField out = continuous->grid().zeros_grid();
        continuous->ode_function()->state_rhs(out, continuous->grid().zeros_grid(), 0.0);
        REQUIRE(out.max_abs() == 0.0);
    }

    SECTION("boundary functions of the wrong size are rejected") {
        HeatBoundaryData bc = HeatBoundaryData::constant(0.0, 1.0);
        bc.exterior = [](const Surface&, Real) { return SurfaceField(3); };
        REQUIRE_THROWS_AS(DirichletHeatConduction(problem->grid(), problem->surface(),
                                                  HeatConductionParameters{}, bc),
                          ConfigurationError);
    }
}

TEST_CASE("Disk heats up to the surface temperature", "[heat][integration]") {
    auto problem = make_problem(1.0, 1.0);
    const CartesianGrid& grid = problem->grid();

    Integrator integ(problem->solution_prototype(), {0.0, 2.0}, problem->ode_function(),
                     problem->timestep());

    const std::vector<Index> interior = points_within(grid, 0.6);
    REQUIRE(!interior.empty());

    std::vector<Real> previous(interior.size(), 0.0);
    SurfaceField ET = problem->surface().zeros_surface();

    for (int n = 0; n < 100; ++n) {
        REQUIRE(integ.step().success);
        const GridField& T = integ.state().state;

        for (size_t k = 0; k < interior.size(); ++k) {
            const Real value = T(interior[k]);
            REQUIRE(value >= previous[k]);
            REQUIRE(value <= 1.06);
            previous[k] = value;
        }
    }

    const GridField& T = integ.state().state;
    REQUIRE(integ.time() == Approx(1.0));
    REQUIRE(T(grid.index(grid.nx() / 2, grid.ny() / 2)) > 0.9);
    REQUIRE(T.values().minCoeff() >= -1e-8);
    REQUIRE(T.all_finite());

    problem->coupling().interpolate(T, ET);
    for (Index k = 0; k < ET.size(); ++k) {
        REQUIRE(ET(k) == Approx(1.0).margin(1e-8));
    }
}

TEST_CASE("Interior overshoot shrinks with the grid spacing", "[heat][integration]") {
    const Real coarse = interior_peak(0.2) - 1.0;
    const Real fine = interior_peak(0.1) - 1.0;

    REQUIRE(coarse > 0.0);
    REQUIRE(coarse <= 0.06);
    REQUIRE(fine <= 0.03);
    REQUIRE(fine < 0.6 * coarse);
}

TEST_CASE("Double layer keeps the exterior cold", "[heat][integration]") {
    auto problem = make_problem(0.0, 1.0);
    const CartesianGrid& grid = problem->grid();

    Integrator integ(problem->solution_prototype(), {0.0, 1.0}, problem->ode_function(),
                     problem->timestep());
    REQUIRE(integ.advance_steps(20).success);

    const GridField& T = integ.state().state;
    REQUIRE(T.all_finite());
    REQUIRE(T(grid.index(grid.nx() / 2, grid.ny() / 2)) > 0.3);
    REQUIRE(std::abs(T(grid.index(0, 0))) < 0.05);
    REQUIRE(T.values().maxCoeff() <= 1.0);

    SurfaceField ET = problem->surface().zeros_surface();
    problem->coupling().interpolate(T, ET);
    for (Index k = 0; k < ET.size(); ++k) {
        REQUIRE(ET(k) == Approx(0.5).margin(1e-8));
    }
}

TEST_CASE("Direct and CG Schur solves give the same temperature", "[heat][integration]") {
    auto problem = make_problem(0.0, 1.0);

    SchurConfig direct;
    direct.method = SchurSolveMethod::Direct;
    SchurConfig cg;
    cg.method = SchurSolveMethod::ConjugateGradient;
    cg.tolerance = 1e-12;

    Integrator a(problem->solution_prototype(), {0.0, 1.0}, problem->ode_function(),
                 problem->timestep(), IntegratorConfig{}, direct);
    Integrator b(problem->solution_prototype(), {0.0, 1.0}, problem->ode_function(),
                 problem->timestep(), IntegratorConfig{}, cg);

    REQUIRE(a.advance_steps(5).success);
    REQUIRE(b.advance_steps(5).success);
    REQUIRE(b.last_step().iterations > 0);

    const Vector diff = a.state().state.values() - b.state().state.values();
    REQUIRE(diff.norm() <= 1e-7 * a.state().state.norm());
}

TEST_CASE("Problem from configuration", "[heat][config]") {
    Config config;
    config.problem.grid_spacing = 0.2;
    config.problem.exterior_temperature = 0.5;
    config.problem.interior_temperature = 0.5;

    auto problem = DirichletHeatConduction::from_config(config);
    REQUIRE(problem->grid().nx() == 20);
    REQUIRE(problem->surface().n_points() ==
            static_cast<Index>(std::ceil(2.0 * constants::PI / (1.4 * 0.2))));

    SurfaceField target = problem->surface().zeros_surface();
    problem->ode_function()->constraint_rhs(target, 0.0);
    REQUIRE(target(0) == Approx(0.5));
}
