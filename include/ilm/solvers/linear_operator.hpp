/**
 * @file linear_operator.hpp
 * @brief Grid-to-grid linear operators and their exponential action
 *
 * Supports:
 * - Dense symmetric operators (closed form via eigendecomposition)
 * - Sparse symmetric operators (Krylov / Lanczos approximation)
 *
 * The integrating-factor schemes only ever need y = exp(tau A) x for a
 * handful of fixed tau values per step. An ExpPropagator bundles one such
 * tau together with whatever it can precompute, and is owned by the
 * integrator that created it.
 *
 * Accuracy of exp_action bounds the accuracy of the time integrator:
 * - Dense: exact up to the eigensolver round-off
 * - Sparse: relative error estimate below KrylovConfig::tolerance per
 *   accepted sub-step
 */

#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../core/grid.hpp"
#include <Eigen/Eigenvalues>

namespace ilm {

/**
 * @brief Applies exp(tau A) for one fixed tau
 *
 * Holds mutable workspace; not safe to share between threads.
 */
class ExpPropagator {
public:
    virtual ~ExpPropagator() = default;

    /// Time interval this propagator advances by
    virtual Real tau() const = 0;

    /// y = exp(tau A) x  (y must not alias x)
    virtual void apply(const Vector& x, Vector& y) const = 0;
};

/**
 * @brief Abstract base for grid linear operators
 */
class LinearOperator {
public:
    virtual ~LinearOperator() = default;

    /// Number of grid unknowns
    virtual Index size() const = 0;

    /// Scaling parameter folded into the operator (e.g. diffusivity)
    virtual Real scale() const = 0;

    /// y = A x
    virtual void apply(const Vector& x, Vector& y) const = 0;

    /// y = exp(tau A) x
    virtual void exp_action(Real tau, const Vector& x, Vector& y) const = 0;

    /**
     * @brief Build a propagator for a fixed tau
     *
     * Default: forwards to exp_action. Implementations override this to
     * cache tau-dependent data.
     */
    virtual UniquePtr<ExpPropagator> propagator(Real tau) const;

    /// Description for diagnostics
    virtual std::string info() const = 0;
};

// ============================================================================
// Dense operator
// ============================================================================

/**
 * @brief Dense symmetric operator, exponential by diagonalization
 *
 * A = scale * matrix = V diag(lambda) V^T, so exp(tau A) x = V diag(e^{tau lambda}) V^T x.
 * Intended for small problems and as a reference in tests.
 */
class DenseLinearOperator : public LinearOperator {
public:
    explicit DenseLinearOperator(const Matrix& matrix, Real scale = 1.0);

    Index size() const override { return matrix_.rows(); }
    Real scale() const override { return scale_; }

    void apply(const Vector& x, Vector& y) const override;
    void exp_action(Real tau, const Vector& x, Vector& y) const override;

    /// Precomputes the dense matrix exp(tau A)
    UniquePtr<ExpPropagator> propagator(Real tau) const override;

    std::string info() const override;

    const Vector& eigenvalues() const { return eigenvalues_; }

private:
    Matrix matrix_;                 // scale already applied
    Real scale_ = 1.0;
    Vector eigenvalues_;
    Matrix eigenvectors_;
};

// ============================================================================
// Sparse operator (Krylov exponential)
// ============================================================================

/**
 * @brief Workspace for the Lanczos exponential
 */
struct KrylovWorkspace {
    Matrix basis;                   ///< [n x (m+1)] orthonormal Lanczos vectors
    Vector alpha;                   ///< Tridiagonal diagonal
    Vector beta;                    ///< Tridiagonal off-diagonal
    Vector w;                       ///< Current Lanczos direction
    Vector coeffs;                  ///< exp(h T_m) e_1
    Index substeps = 0;             ///< Accepted sub-steps of the last call
};

/**
 * @brief Sparse symmetric operator, exponential by Lanczos projection
 *
 * exp(tau A) x ~ ||x|| V_m exp(tau T_m) e_1 with V_m the Lanczos basis of
 * K_m(A, x) and T_m the projected tridiagonal matrix. When the a-posteriori
 * estimate  ||x|| beta_{m+1} |e_m^T exp(h T_m) e_1|  exceeds the tolerance,
 * the interval is split and advanced in sub-steps.
 */
class SparseLinearOperator : public LinearOperator {
public:
    SparseLinearOperator(SparseMatrix matrix, Real scale, const KrylovConfig& config = {});

    Index size() const override { return matrix_.rows(); }
    Real scale() const override { return scale_; }

    void apply(const Vector& x, Vector& y) const override;
    void exp_action(Real tau, const Vector& x, Vector& y) const override;

    /// Propagator with its own persistent Krylov workspace
    UniquePtr<ExpPropagator> propagator(Real tau) const override;

    std::string info() const override;

    /// Exponential action with caller-owned workspace
    void exp_action(Real tau, const Vector& x, Vector& y, KrylovWorkspace& ws) const;

    const SparseMatrix& matrix() const { return matrix_; }
    const KrylovConfig& krylov_config() const { return config_; }

private:
    SparseMatrix matrix_;           // scale already applied
    Real scale_ = 1.0;
    KrylovConfig config_;

    /// One Lanczos projection over interval h; returns the error estimate
    Real lanczos_step(Real h, const Vector& v, Real beta0, KrylovWorkspace& ws, Index& m) const;
};

// ============================================================================
// Builders
// ============================================================================

/**
 * @brief 5-point Laplacian on the grid, scaled by kappa
 *
 * Values outside the grid are zero (homogeneous Dirichlet data one cell
 * beyond the last cell centre).
 */
SparseMatrix laplacian_matrix(const CartesianGrid& grid);

/**
 * @brief kappa * Laplacian as a Krylov-exponentiated operator
 */
Ptr<SparseLinearOperator> laplacian(const CartesianGrid& grid, Real kappa,
                                    const KrylovConfig& config = {});

} // namespace ilm
