/**
 * @file regularization.hpp
 * @brief Grid <-> surface coupling operators
 *
 * Interpolation E (grid -> surface) is stored as a sparse matrix whose
 * rows are partitions of unity. Regularization is built as its adjoint
 * under the grid and surface inner products,
 *
 *   R = W_g^{-1} E^T W_s,   so that  <E u, q>_surface = <u, R q>_grid,
 *
 * with W_g = dx^2 I and W_s = diag(ds).
 */

#pragma once

#include "../core/types.hpp"
#include "../core/field.hpp"
#include "../core/grid.hpp"
#include "../core/surface.hpp"

namespace ilm {

class CouplingOperators {
public:
    CouplingOperators() = default;

    /**
     * @brief Build from externally supplied interpolation weights
     *
     * @param grid Grid the operators act on
     * @param surface Surface the operators act on
     * @param interpolation Sparse matrix [n_surface x n_grid]
     */
    CouplingOperators(const CartesianGrid& grid, const Surface& surface,
                      SparseMatrix interpolation);

    /**
     * @brief Bilinear (tensor-product hat) interpolation weights
     *
     * Each surface point couples to the 2x2 block of cell centres around
     * it. Every point must lie at least half a cell inside the grid.
     */
    static CouplingOperators bilinear(const CartesianGrid& grid, const Surface& surface);

    /// Same as the constructor; reads better at call sites
    static CouplingOperators from_matrix(const CartesianGrid& grid, const Surface& surface,
                                         SparseMatrix interpolation) {
        return CouplingOperators(grid, surface, std::move(interpolation));
    }

    // ------------------------------------------------------------------
    // Operators (callers allocate, the operators overwrite)
    // ------------------------------------------------------------------

    /// out = E u, component by component
    void interpolate(const GridField& u, SurfaceField& out) const;

    /// out = R q, component by component
    void regularize(const SurfaceField& q, GridField& out) const;

    /// out (2 components) = R (q n) for scalar surface data q
    void regularize_normal(const SurfaceField& q, GridField& out) const;

    /// Central-difference divergence of a 2-component grid field (zero outside the grid)
    void divergence(const GridField& v, GridField& out) const;

    /**
     * @brief Double-layer source: out = div(R(q n))
     *
     * @param scratch 2-component grid buffer reused across calls
     */
    void surface_divergence(const SurfaceField& q, GridField& out, GridField& scratch) const;

    // ------------------------------------------------------------------
    // Accessors
    // ------------------------------------------------------------------

    Index n_grid() const { return grid_.n_points(); }
    Index n_surface() const { return surface_.n_points(); }

    const CartesianGrid& grid() const { return grid_; }
    const Surface& surface() const { return surface_; }

    const InnerProducts& inner_products() const { return inner_; }

    const SparseMatrix& interpolation_matrix() const { return interp_; }
    const SparseMatrix& regularization_matrix() const { return regul_; }

private:
    CartesianGrid grid_;
    Surface surface_;
    SparseMatrix interp_;           // [n_surface x n_grid]
    SparseMatrix regul_;            // [n_grid x n_surface]
    SurfaceField normals_;
    InnerProducts inner_;
};

} // namespace ilm
