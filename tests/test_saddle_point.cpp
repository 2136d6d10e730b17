/**
 * @file test_saddle_point.cpp
 * @brief Schur-complement solves on a small immersed circle
 *
 * Uses a dense reference exponential so that repeated applications of
 * the same propagator are bitwise reproducible.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "ilm/ilm.hpp"
#include <cmath>
#include <random>

using namespace ilm;
using Catch::Approx;

namespace {

constexpr Real TAU = 0.01;

struct SmallSystem {
    CartesianGrid grid{{-1.0, 1.0}, {-1.0, 1.0}, 0.2};
    Surface body = Surface::circle(0.5, 0.28);
    Ptr<CouplingOperators> coupling =
        std::make_shared<CouplingOperators>(CouplingOperators::bilinear(grid, body));
    Ptr<DenseLinearOperator> L =
        std::make_shared<DenseLinearOperator>(Matrix(laplacian_matrix(grid)), 1.0);

    ConstrainedODEFunction::Operators operators() const {
        auto c = coupling;
        ConstrainedODEFunction::Operators ops;
        ops.state_rhs = [](GridField& out, const GridField&, Real) { out.set_zero(); };
        ops.constraint_rhs = [](SurfaceField& out, Real) { out.set_zero(); };
        ops.constraint_force = [c](GridField& out, const SurfaceField& sigma) {
            c->regularize(sigma, out);
            out *= -1.0;
        };
        ops.constraint_op = [c](SurfaceField& out, const GridField& u) { c->interpolate(u, out); };
        return ops;
    }

    ConstrainedODEFunction function(ConstrainedODEFunction::Operators ops) const {
        ConstraintConfig cfg;
        cfg.check_adjoint = false;
        return ConstrainedODEFunction(std::move(ops), L,
                                      CoupledState(grid.zeros_grid(), body.zeros_surface()),
                                      coupling->inner_products(), cfg);
    }
};

template<typename F>
void randomize(F& f, unsigned seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<Real> dist(-1.0, 1.0);
    for (Index i = 0; i < f.size(); ++i) {
        f(i) = dist(gen);
    }
}

SchurConfig with_method(SchurSolveMethod method) {
    SchurConfig cfg;
    cfg.method = method;
    cfg.tolerance = 1e-12;
    return cfg;
}

} // namespace

TEST_CASE("Direct Schur solve enforces the constraint", "[saddle_point]") {
    SmallSystem sys;
    auto f = sys.function(sys.operators());
    auto H = sys.L->propagator(TAU);

    GridField r = sys.grid.zeros_grid();
    SurfaceField g = sys.body.zeros_surface();
    randomize(r, 1);
    randomize(g, 2);

    GridField x = sys.grid.zeros_grid();
    GridField response = sys.grid.zeros_grid();
    SurfaceField sigma = sys.body.zeros_surface();

    SaddlePointSolver solver(f, with_method(SchurSolveMethod::Direct));
    REQUIRE(solver.method() == SchurSolveMethod::Direct);

    SolveResult result = solver.solve(*H, r, g, x, sigma, response);
    REQUIRE(result.converged);
    REQUIRE(result.iterations == 0);
    REQUIRE(result.final_residual <= 1e-10);
    REQUIRE(result.solve_time_ms >= 0.0);
    REQUIRE(sigma.max_abs() > 0.0);

    SurfaceField Ex = sys.body.zeros_surface();
    sys.coupling->interpolate(x, Ex);
    REQUIRE((Ex.values() - g.values()).norm() <= 1e-9 * g.norm());

    // x = H r + force response
    GridField Hr = sys.grid.zeros_grid();
    H->apply(r.values(), Hr.values());
    REQUIRE((x.values() - Hr.values() - response.values()).norm() <= 1e-12 * x.norm());

    SECTION("the factorization is cached per propagator") {
        solver.solve(*H, r, g, x, sigma, response);
        REQUIRE(solver.info().find("cached factorizations=1") != std::string::npos);
        solver.clear_cache();
        REQUIRE(solver.info().find("cached factorizations=0") != std::string::npos);
    }

    SECTION("the assembled complement is symmetric") {
        REQUIRE(solver.last_asymmetry() <= 1e-12);
    }
}

TEST_CASE("Conjugate gradient agrees with the direct solve", "[saddle_point]") {
    SmallSystem sys;
    auto f = sys.function(sys.operators());
    auto H = sys.L->propagator(TAU);

    GridField r = sys.grid.zeros_grid();
    SurfaceField g = sys.body.zeros_surface();
    randomize(r, 3);
    randomize(g, 4);

    GridField x_direct = sys.grid.zeros_grid();
    GridField x_cg = sys.grid.zeros_grid();
    GridField response = sys.grid.zeros_grid();
    SurfaceField sigma_direct = sys.body.zeros_surface();
    SurfaceField sigma_cg = sys.body.zeros_surface();

    SaddlePointSolver direct(f, with_method(SchurSolveMethod::Direct));
    SaddlePointSolver cg(f, with_method(SchurSolveMethod::ConjugateGradient));

    direct.solve(*H, r, g, x_direct, sigma_direct, response);
    SolveResult result = cg.solve(*H, r, g, x_cg, sigma_cg, response);

    REQUIRE(result.converged);
    REQUIRE(result.iterations > 0);
    REQUIRE((sigma_cg.values() - sigma_direct.values()).norm() <= 1e-7 * sigma_direct.norm());
    REQUIRE((x_cg.values() - x_direct.values()).norm() <= 1e-7 * x_direct.norm());
}

TEST_CASE("Auto method switches on the dense threshold", "[saddle_point]") {
    SmallSystem sys;
    auto f = sys.function(sys.operators());

    SchurConfig cfg;
    REQUIRE(SaddlePointSolver(f, cfg).method() == SchurSolveMethod::Direct);

    cfg.dense_threshold = sys.body.n_points() - 1;
    REQUIRE(SaddlePointSolver(f, cfg).method() == SchurSolveMethod::ConjugateGradient);
}

TEST_CASE("Zero reduced right-hand side gives a zero multiplier", "[saddle_point]") {
    SmallSystem sys;
    auto f = sys.function(sys.operators());
    auto H = sys.L->propagator(TAU);

    GridField r = sys.grid.zeros_grid();
    randomize(r, 5);

    // Target equal to what the unforced state already satisfies
    GridField Hr = sys.grid.zeros_grid();
    H->apply(r.values(), Hr.values());
    SurfaceField g = sys.body.zeros_surface();
    f.constraint_op(g, Hr);

    GridField x = sys.grid.zeros_grid();
    GridField response = sys.grid.zeros_grid();
    SurfaceField sigma = sys.body.zeros_surface();
    sigma.fill(3.0);

    SaddlePointSolver solver(f, with_method(SchurSolveMethod::Direct));
    SolveResult result = solver.solve(*H, r, g, x, sigma, response);

    REQUIRE(result.converged);
    REQUIRE(sigma.max_abs() == 0.0);
    REQUIRE(response.max_abs() == 0.0);
    REQUIRE((x.values() - Hr.values()).norm() == 0.0);
}

TEST_CASE("Singular Schur complement is detected", "[saddle_point]") {
    SmallSystem sys;
    auto ops = sys.operators();
    ops.constraint_op = [](SurfaceField& out, const GridField&) { out.set_zero(); };
    auto f = sys.function(ops);
    auto H = sys.L->propagator(TAU);

    GridField r = sys.grid.zeros_grid();
    SurfaceField g = sys.body.ones_surface();
    GridField x = sys.grid.zeros_grid();
    GridField response = sys.grid.zeros_grid();
    SurfaceField sigma = sys.body.zeros_surface();

    SECTION("direct") {
        SaddlePointSolver solver(f, with_method(SchurSolveMethod::Direct));
        REQUIRE_THROWS_AS(solver.solve(*H, r, g, x, sigma, response), SingularSystem);
    }

    SECTION("conjugate gradient") {
        SaddlePointSolver solver(f, with_method(SchurSolveMethod::ConjugateGradient));
        REQUIRE_THROWS_AS(solver.solve(*H, r, g, x, sigma, response), SingularSystem);
    }
}

TEST_CASE("Coincident surface points with different targets are singular", "[saddle_point]") {
    SmallSystem sys;
    const Vec2 p(0.05, 0.1);
    sys.body = Surface({p, p}, {Vec2(1.0, 0.0), Vec2(1.0, 0.0)}, Vector::Constant(2, 0.1));
    sys.coupling = std::make_shared<CouplingOperators>(CouplingOperators::bilinear(sys.grid, sys.body));
    auto f = sys.function(sys.operators());
    auto H = sys.L->propagator(TAU);

    GridField r = sys.grid.zeros_grid();
    SurfaceField g = sys.body.zeros_surface();
    g(0) = 1.0;
    GridField x = sys.grid.zeros_grid();
    GridField response = sys.grid.zeros_grid();
    SurfaceField sigma = sys.body.zeros_surface();

    SECTION("direct") {
        SaddlePointSolver solver(f, with_method(SchurSolveMethod::Direct));
        REQUIRE_THROWS_AS(solver.solve(*H, r, g, x, sigma, response), SingularSystem);
    }

    SECTION("conjugate gradient") {
        SaddlePointSolver solver(f, with_method(SchurSolveMethod::ConjugateGradient));
        REQUIRE_THROWS_AS(solver.solve(*H, r, g, x, sigma, response), SingularSystem);
    }

    SECTION("a consistent target is still solvable by CG") {
        g.fill(1.0);
        SaddlePointSolver solver(f, with_method(SchurSolveMethod::ConjugateGradient));
        SolveResult result = solver.solve(*H, r, g, x, sigma, response);
        REQUIRE(result.converged);
        REQUIRE(sigma(0) == Approx(sigma(1)));

        SurfaceField Ex = sys.body.zeros_surface();
        sys.coupling->interpolate(x, Ex);
        REQUIRE(Ex(0) == Approx(1.0).margin(1e-9));
    }
}

TEST_CASE("Exhausted CG budget is reported, not thrown", "[saddle_point]") {
    SmallSystem sys;
    auto f = sys.function(sys.operators());
    auto H = sys.L->propagator(TAU);

    GridField r = sys.grid.zeros_grid();
    SurfaceField g = sys.body.zeros_surface();
    randomize(r, 6);
    randomize(g, 7);

    GridField x = sys.grid.zeros_grid();
    GridField response = sys.grid.zeros_grid();
    SurfaceField sigma = sys.body.zeros_surface();

    SchurConfig cfg = with_method(SchurSolveMethod::ConjugateGradient);
    cfg.max_iterations = 1;
    cfg.tolerance = 1e-14;
    SaddlePointSolver solver(f, cfg);

    SolveResult result;
    REQUIRE_NOTHROW(result = solver.solve(*H, r, g, x, sigma, response));
    REQUIRE(!result.converged);
    REQUIRE(result.final_residual > 1e-14);
    REQUIRE(result.message.find("exhausted") != std::string::npos);
}

TEST_CASE("Inconsistent operator pair is reported as asymmetric", "[saddle_point]") {
    SmallSystem sys;
    auto ops = sys.operators();
    auto c = sys.coupling;
    const Index n = sys.body.n_points();
    ops.constraint_force = [c, n](GridField& out, const SurfaceField& sigma) {
        SurfaceField scaled = sigma;
        for (Index k = 0; k < n; ++k) {
            scaled(k) *= 1.0 + static_cast<Real>(k) / static_cast<Real>(n);
        }
        c->regularize(scaled, out);
        out *= -1.0;
    };
    auto f = sys.function(ops);
    auto H = sys.L->propagator(TAU);

    GridField r = sys.grid.zeros_grid();
    SurfaceField g = sys.body.ones_surface();
    GridField x = sys.grid.zeros_grid();
    GridField response = sys.grid.zeros_grid();
    SurfaceField sigma = sys.body.zeros_surface();

    SaddlePointSolver solver(f, with_method(SchurSolveMethod::Direct));
    solver.solve(*H, r, g, x, sigma, response);
    REQUIRE(solver.last_asymmetry() > 1e-8);
}

TEST_CASE("Unconstrained solve is a pure exponential", "[saddle_point]") {
    SmallSystem sys;
    ConstrainedODEFunction::Operators ops;
    ops.state_rhs = [](GridField& out, const GridField&, Real) { out.set_zero(); };
    ops.constraint_rhs = [](SurfaceField&, Real) {};
    ops.constraint_force = [](GridField& out, const SurfaceField&) { out.set_zero(); };
    ops.constraint_op = [](SurfaceField&, const GridField&) {};
    ConstrainedODEFunction f(ops, sys.L, CoupledState(sys.grid.zeros_grid(), SurfaceField(0)));
    auto H = sys.L->propagator(TAU);

    GridField r = sys.grid.zeros_grid();
    randomize(r, 8);
    GridField x = sys.grid.zeros_grid();
    GridField response = sys.grid.zeros_grid();
    SurfaceField sigma(0);

    SaddlePointSolver solver(f);
    SolveResult result = solver.solve(*H, r, SurfaceField(0), x, sigma, response);

    GridField Hr = sys.grid.zeros_grid();
    H->apply(r.values(), Hr.values());
    REQUIRE(result.converged);
    REQUIRE((x.values() - Hr.values()).norm() == 0.0);
    REQUIRE(response.max_abs() == 0.0);
}

TEST_CASE("Saddle-point solve checks buffer shapes", "[saddle_point]") {
    SmallSystem sys;
    auto f = sys.function(sys.operators());
    auto H = sys.L->propagator(TAU);

    GridField r(5);
    SurfaceField g = sys.body.zeros_surface();
    GridField x = sys.grid.zeros_grid();
    GridField response = sys.grid.zeros_grid();
    SurfaceField sigma = sys.body.zeros_surface();

    SaddlePointSolver solver(f);
    REQUIRE_THROWS_AS(solver.solve(*H, r, g, x, sigma, response), ConfigurationError);
}
