/**
 * @file regularization.cpp
 * @brief Grid <-> surface coupling operators
 */

#include "ilm/coupling/regularization.hpp"
#include "ilm/core/errors.hpp"
#include <cmath>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace ilm {

namespace {

using StridedMap = Eigen::Map<Vector, 0, Eigen::InnerStride<>>;
using ConstStridedMap = Eigen::Map<const Vector, 0, Eigen::InnerStride<>>;

template<typename F>
void require_shape(const F& f, Index n_points, Index n_components, const char* what) {
    if (f.n_points() != n_points || f.n_components() != n_components) {
        throw ConfigurationError(std::string(what) + ": field shape mismatch (got " +
                                 std::to_string(f.n_points()) + "x" + std::to_string(f.n_components()) +
                                 ", expected " + std::to_string(n_points) + "x" +
                                 std::to_string(n_components) + ")");
    }
}

} // namespace

CouplingOperators::CouplingOperators(const CartesianGrid& grid, const Surface& surface,
                                     SparseMatrix interpolation)
    : grid_(grid)
    , surface_(surface)
    , interp_(std::move(interpolation))
    , normals_(surface.normals_field())
{
    if (interp_.rows() != surface_.n_points() || interp_.cols() != grid_.n_points()) {
        throw ConfigurationError("Interpolation matrix must be [n_surface x n_grid]");
    }

    inner_.grid_weight = grid_.cell_area();
    inner_.surface_weights = surface_.ds();

    // R = W_g^{-1} E^T W_s
    SparseMatrix et = interp_.transpose();
    for (int k = 0; k < et.outerSize(); ++k) {
        for (SparseMatrix::InnerIterator it(et, k); it; ++it) {
            it.valueRef() *= surface_.ds()(it.col()) / inner_.grid_weight;
        }
    }
    regul_ = std::move(et);
}

CouplingOperators CouplingOperators::bilinear(const CartesianGrid& grid, const Surface& surface) {
    const Index n = surface.n_points();
    const Real dx = grid.cell_size();

    std::vector<SparseTriplet> triplets;
    triplets.reserve(4 * n);

    for (Index k = 0; k < n; ++k) {
        const Vec2& X = surface.point(k);

        // Fractional cell-centre coordinates
        const Real fx = (X.x() - grid.xmin()) / dx - 0.5;
        const Real fy = (X.y() - grid.ymin()) / dx - 0.5;
        const Index i0 = static_cast<Index>(std::floor(fx));
        const Index j0 = static_cast<Index>(std::floor(fy));

        if (i0 < 0 || j0 < 0 || i0 + 1 >= grid.nx() || j0 + 1 >= grid.ny()) {
            throw ConfigurationError("Surface point " + std::to_string(k) +
                                     " lies too close to the grid boundary");
        }

        const Real tx = fx - static_cast<Real>(i0);
        const Real ty = fy - static_cast<Real>(j0);

        const std::array<Real, 2> wx = {1.0 - tx, tx};
        const std::array<Real, 2> wy = {1.0 - ty, ty};

        for (Index b = 0; b < 2; ++b) {
            for (Index a = 0; a < 2; ++a) {
                const Real w = wx[a] * wy[b];
                if (w != 0.0) {
                    triplets.emplace_back(k, grid.index(i0 + a, j0 + b), w);
                }
            }
        }
    }

    SparseMatrix E(n, grid.n_points());
    E.setFromTriplets(triplets.begin(), triplets.end());
    return CouplingOperators(grid, surface, std::move(E));
}

void CouplingOperators::interpolate(const GridField& u, SurfaceField& out) const {
    const Index nc = u.n_components();
    require_shape(u, n_grid(), nc, "interpolate input");
    require_shape(out, n_surface(), nc, "interpolate output");

    if (nc == 1) {
        out.values().noalias() = interp_ * u.values();
        return;
    }
    for (Index c = 0; c < nc; ++c) {
        ConstStridedMap uc(u.values().data() + c, n_grid(), Eigen::InnerStride<>(nc));
        StridedMap oc(out.values().data() + c, n_surface(), Eigen::InnerStride<>(nc));
        oc = interp_ * uc;
    }
}

void CouplingOperators::regularize(const SurfaceField& q, GridField& out) const {
    const Index nc = q.n_components();
    require_shape(q, n_surface(), nc, "regularize input");
    require_shape(out, n_grid(), nc, "regularize output");

    if (nc == 1) {
        out.values().noalias() = regul_ * q.values();
        return;
    }
    for (Index c = 0; c < nc; ++c) {
        ConstStridedMap qc(q.values().data() + c, n_surface(), Eigen::InnerStride<>(nc));
        StridedMap oc(out.values().data() + c, n_grid(), Eigen::InnerStride<>(nc));
        oc = regul_ * qc;
    }
}

void CouplingOperators::regularize_normal(const SurfaceField& q, GridField& out) const {
    require_shape(q, n_surface(), 1, "regularize_normal input");
    require_shape(out, n_grid(), 2, "regularize_normal output");

    for (Index c = 0; c < 2; ++c) {
        ConstStridedMap nc(normals_.values().data() + c, n_surface(), Eigen::InnerStride<>(2));
        StridedMap oc(out.values().data() + c, n_grid(), Eigen::InnerStride<>(2));
        oc = regul_ * nc.cwiseProduct(q.values());
    }
}

void CouplingOperators::divergence(const GridField& v, GridField& out) const {
    require_shape(v, n_grid(), 2, "divergence input");
    require_shape(out, n_grid(), 1, "divergence output");

    const Index nx = grid_.nx();
    const Index ny = grid_.ny();
    const Real inv2dx = 0.5 / grid_.cell_size();

    // Each output sample is written by exactly one iteration
    #pragma omp parallel for
    for (Index j = 0; j < ny; ++j) {
        for (Index i = 0; i < nx; ++i) {
            const Real vx_e = (i + 1 < nx) ? v(grid_.index(i + 1, j), 0) : 0.0;
            const Real vx_w = (i > 0) ? v(grid_.index(i - 1, j), 0) : 0.0;
            const Real vy_n = (j + 1 < ny) ? v(grid_.index(i, j + 1), 1) : 0.0;
            const Real vy_s = (j > 0) ? v(grid_.index(i, j - 1), 1) : 0.0;
            out(grid_.index(i, j)) = inv2dx * ((vx_e - vx_w) + (vy_n - vy_s));
        }
    }
}

void CouplingOperators::surface_divergence(const SurfaceField& q, GridField& out,
                                           GridField& scratch) const {
    regularize_normal(q, scratch);
    divergence(scratch, out);
}

} // namespace ilm
