/**
 * @file test_coupling.cpp
 * @brief Interpolation / regularization pair on a circle
 *
 * The regularization operator is built as the adjoint of interpolation,
 * which is what keeps the Schur complement symmetric. These tests pin
 * down that pairing and the conservation properties of the double-layer
 * source.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "ilm/ilm.hpp"
#include <cmath>
#include <random>

using namespace ilm;
using Catch::Approx;

namespace {

struct CircleSetup {
    CartesianGrid grid{{-2.0, 2.0}, {-2.0, 2.0}, 0.2};
    Surface body = Surface::circle(1.0, 0.28);
    CouplingOperators coupling = CouplingOperators::bilinear(grid, body);
};

template<typename F>
void randomize(F& f, std::mt19937& gen) {
    std::uniform_real_distribution<Real> dist(-1.0, 1.0);
    for (Index i = 0; i < f.size(); ++i) {
        f(i) = dist(gen);
    }
}

} // namespace

TEST_CASE("Interpolation rows are partitions of unity", "[coupling]") {
    CircleSetup s;

    GridField ones = s.grid.zeros_grid();
    ones.fill(1.0);
    SurfaceField out = s.body.zeros_surface();
    s.coupling.interpolate(ones, out);

    for (Index k = 0; k < out.size(); ++k) {
        REQUIRE(out(k) == Approx(1.0));
    }
}

TEST_CASE("Bilinear interpolation reproduces linear functions", "[coupling]") {
    CircleSetup s;

    auto f = [](Real x, Real y) { return 1.0 + 2.0 * x - y; };
    GridField u = s.grid.evaluate(f);
    SurfaceField out = s.body.zeros_surface();
    s.coupling.interpolate(u, out);

    for (Index k = 0; k < s.body.n_points(); ++k) {
        const Vec2& X = s.body.point(k);
        REQUIRE(out(k) == Approx(f(X.x(), X.y())).margin(1e-12));
    }

    SECTION("vector-valued data is interpolated per component") {
        GridField v = s.grid.zeros_grid(2);
        for (Index p = 0; p < s.grid.n_points(); ++p) {
            v(p, 0) = u(p);
            v(p, 1) = -u(p);
        }
        SurfaceField vs = s.body.zeros_surface(2);
        s.coupling.interpolate(v, vs);
        for (Index k = 0; k < s.body.n_points(); ++k) {
            REQUIRE(vs(k, 0) == Approx(out(k)));
            REQUIRE(vs(k, 1) == Approx(-out(k)));
        }
    }
}

TEST_CASE("Regularization is the adjoint of interpolation", "[coupling]") {
    CircleSetup s;
    const InnerProducts& ip = s.coupling.inner_products();
    std::mt19937 gen(7);

    GridField u = s.grid.zeros_grid();
    SurfaceField q = s.body.zeros_surface();
    SurfaceField Eu = s.body.zeros_surface();
    GridField Rq = s.grid.zeros_grid();

    for (int trial = 0; trial < 3; ++trial) {
        randomize(u, gen);
        randomize(q, gen);
        s.coupling.interpolate(u, Eu);
        s.coupling.regularize(q, Rq);

        const Real lhs = ip.surface(Eu, q);
        const Real rhs = ip.grid(u, Rq);
        REQUIRE(std::abs(lhs - rhs) <= 1e-12 * (std::abs(lhs) + 1.0));
    }
}

TEST_CASE("Regularization conserves the surface integral", "[coupling]") {
    CircleSetup s;

    SurfaceField q = s.body.ones_surface();
    GridField Rq = s.grid.zeros_grid();
    s.coupling.regularize(q, Rq);

    const Real grid_integral = Rq.values().sum() * s.grid.cell_area();
    REQUIRE(grid_integral == Approx(s.body.length()));
}

TEST_CASE("Grid divergence", "[coupling]") {
    CircleSetup s;

    SECTION("linear field has constant divergence in the interior") {
        GridField v = s.grid.zeros_grid(2);
        for (Index j = 0; j < s.grid.ny(); ++j) {
            for (Index i = 0; i < s.grid.nx(); ++i) {
                v(s.grid.index(i, j), 0) = s.grid.x(i);
                v(s.grid.index(i, j), 1) = s.grid.y(j);
            }
        }
        GridField div = s.grid.zeros_grid();
        s.coupling.divergence(v, div);
        REQUIRE(div(s.grid.index(10, 10)) == Approx(2.0));
        REQUIRE(div(s.grid.index(5, 14)) == Approx(2.0));
    }

    SECTION("double-layer source integrates to zero") {
        std::mt19937 gen(3);
        SurfaceField q = s.body.zeros_surface();
        randomize(q, gen);

        GridField out = s.grid.zeros_grid();
        GridField scratch = s.grid.zeros_grid(2);
        s.coupling.surface_divergence(q, out, scratch);

        REQUIRE(out.max_abs() > 0.0);
        REQUIRE(std::abs(out.values().sum()) <= 1e-10 * out.values().cwiseAbs().sum());
    }
}

TEST_CASE("Coupling rejects bad geometry and shapes", "[coupling]") {
    CartesianGrid grid({-2.0, 2.0}, {-2.0, 2.0}, 0.2);

    Surface edge({Vec2(1.95, 0.0)}, {Vec2(1.0, 0.0)}, Vector::Constant(1, 0.1));
    REQUIRE_THROWS_AS(CouplingOperators::bilinear(grid, edge), ConfigurationError);

    Surface body = Surface::circle(1.0, 0.28);
    REQUIRE_THROWS_AS(CouplingOperators(grid, body, SparseMatrix(3, 3)), ConfigurationError);

    CouplingOperators coupling = CouplingOperators::bilinear(grid, body);
    GridField wrong(10);
    SurfaceField out = body.zeros_surface();
    REQUIRE_THROWS_AS(coupling.interpolate(wrong, out), ConfigurationError);
}
