/**
 * @file linear_operator.cpp
 * @brief Linear operator and exponential action implementations
 */

#include "ilm/solvers/linear_operator.hpp"
#include "ilm/core/errors.hpp"
#include <sstream>
#include <cmath>

namespace ilm {

namespace {

/// Forwards to LinearOperator::exp_action
class ActionPropagator : public ExpPropagator {
public:
    ActionPropagator(const LinearOperator& op, Real tau) : op_(op), tau_(tau) {}

    Real tau() const override { return tau_; }

    void apply(const Vector& x, Vector& y) const override {
        op_.exp_action(tau_, x, y);
    }

private:
    const LinearOperator& op_;
    Real tau_;
};

/// Precomputed dense exp(tau A)
class DensePropagator : public ExpPropagator {
public:
    DensePropagator(Matrix expm, Real tau) : expm_(std::move(expm)), tau_(tau) {}

    Real tau() const override { return tau_; }

    void apply(const Vector& x, Vector& y) const override {
        y.noalias() = expm_ * x;
    }

private:
    Matrix expm_;
    Real tau_;
};

/// Lanczos exponential with persistent workspace
class KrylovPropagator : public ExpPropagator {
public:
    KrylovPropagator(const SparseLinearOperator& op, Real tau) : op_(op), tau_(tau) {}

    Real tau() const override { return tau_; }

    void apply(const Vector& x, Vector& y) const override {
        op_.exp_action(tau_, x, y, workspace_);
    }

private:
    const SparseLinearOperator& op_;
    Real tau_;
    mutable KrylovWorkspace workspace_;
};

void require_size(const Vector& x, Index n, const char* what) {
    if (x.size() != n) {
        std::ostringstream oss;
        oss << what << ": vector size " << x.size() << " does not match operator size " << n;
        throw ConfigurationError(oss.str());
    }
}

} // namespace

// ============================================================================
// LinearOperator
// ============================================================================

UniquePtr<ExpPropagator> LinearOperator::propagator(Real tau) const {
    return std::make_unique<ActionPropagator>(*this, tau);
}

// ============================================================================
// DenseLinearOperator
// ============================================================================

DenseLinearOperator::DenseLinearOperator(const Matrix& matrix, Real scale)
    : matrix_(scale * matrix)
    , scale_(scale)
{
    if (matrix_.rows() != matrix_.cols()) {
        throw ConfigurationError("DenseLinearOperator requires a square matrix");
    }

    const Real norm = matrix_.norm();
    if ((matrix_ - matrix_.transpose()).norm() > 1e-12 * (norm + constants::EPSILON)) {
        throw ConfigurationError("DenseLinearOperator requires a symmetric matrix");
    }

    Eigen::SelfAdjointEigenSolver<Matrix> es(matrix_);
    if (es.info() != Eigen::Success) {
        throw ConfigurationError("DenseLinearOperator: eigendecomposition failed");
    }
    eigenvalues_ = es.eigenvalues();
    eigenvectors_ = es.eigenvectors();
}

void DenseLinearOperator::apply(const Vector& x, Vector& y) const {
    require_size(x, size(), "DenseLinearOperator::apply");
    y.noalias() = matrix_ * x;
}

void DenseLinearOperator::exp_action(Real tau, const Vector& x, Vector& y) const {
    require_size(x, size(), "DenseLinearOperator::exp_action");
    Vector modal = eigenvectors_.transpose() * x;
    modal.array() *= (tau * eigenvalues_.array()).exp();
    y.noalias() = eigenvectors_ * modal;
}

UniquePtr<ExpPropagator> DenseLinearOperator::propagator(Real tau) const {
    Vector factors = (tau * eigenvalues_.array()).exp().matrix();
    Matrix expm = eigenvectors_ * factors.asDiagonal() * eigenvectors_.transpose();
    if (!expm.allFinite()) {
        throw NumericalDivergence("Dense matrix exponential overflowed");
    }
    return std::make_unique<DensePropagator>(std::move(expm), tau);
}

std::string DenseLinearOperator::info() const {
    std::ostringstream oss;
    oss << "Dense symmetric operator (n=" << size() << ", scale=" << scale_
        << ", lambda in [" << eigenvalues_.minCoeff() << ", " << eigenvalues_.maxCoeff() << "])";
    return oss.str();
}

// ============================================================================
// SparseLinearOperator
// ============================================================================

SparseLinearOperator::SparseLinearOperator(SparseMatrix matrix, Real scale, const KrylovConfig& config)
    : matrix_(std::move(matrix))
    , scale_(scale)
    , config_(config)
{
    if (matrix_.rows() != matrix_.cols()) {
        throw ConfigurationError("SparseLinearOperator requires a square matrix");
    }
    matrix_ *= scale_;

    SparseMatrix transposed = matrix_.transpose();
    const Real norm = matrix_.norm();
    if ((matrix_ - transposed).norm() > 1e-12 * (norm + constants::EPSILON)) {
        throw ConfigurationError("SparseLinearOperator: Lanczos exponential requires a symmetric matrix");
    }
}

void SparseLinearOperator::apply(const Vector& x, Vector& y) const {
    require_size(x, size(), "SparseLinearOperator::apply");
    y.noalias() = matrix_ * x;
}

void SparseLinearOperator::exp_action(Real tau, const Vector& x, Vector& y) const {
    KrylovWorkspace ws;
    exp_action(tau, x, y, ws);
}

UniquePtr<ExpPropagator> SparseLinearOperator::propagator(Real tau) const {
    return std::make_unique<KrylovPropagator>(*this, tau);
}

std::string SparseLinearOperator::info() const {
    std::ostringstream oss;
    oss << "Sparse symmetric operator (n=" << size() << ", nnz=" << matrix_.nonZeros()
        << ", scale=" << scale_ << ", Krylov m=" << config_.subspace_dim
        << ", tol=" << config_.tolerance << ")";
    return oss.str();
}

Real SparseLinearOperator::lanczos_step(Real h, const Vector& v, Real beta0,
                                        KrylovWorkspace& ws, Index& m) const {
    const Index n = size();
    const Index m_max = std::min<Index>(config_.subspace_dim, n);

    if (ws.basis.rows() != n || ws.basis.cols() != m_max + 1) {
        ws.basis.resize(n, m_max + 1);
    }
    ws.alpha.resize(m_max);
    ws.beta.resize(m_max);

    ws.basis.col(0) = v / beta0;

    m = m_max;
    Real next_beta = 0.0;
    bool breakdown = false;
    Vector proj;

    for (Index j = 0; j < m_max; ++j) {
        ws.w.noalias() = matrix_ * ws.basis.col(j);

        // Full reorthogonalization (two passes of classical Gram-Schmidt)
        auto V = ws.basis.leftCols(j + 1);
        proj.noalias() = V.transpose() * ws.w;
        ws.w.noalias() -= V * proj;
        ws.alpha(j) = proj(j);
        proj.noalias() = V.transpose() * ws.w;
        ws.w.noalias() -= V * proj;
        ws.alpha(j) += proj(j);

        const Real b = ws.w.norm();
        ws.beta(j) = b;

        const Real scale = std::abs(ws.alpha(j)) + (j > 0 ? ws.beta(j - 1) : 0.0);
        if (b <= 1e-12 * (scale + constants::EPSILON)) {
            // Invariant subspace found: projection is exact
            m = j + 1;
            breakdown = true;
            break;
        }

        next_beta = b;
        if (j + 1 < m_max + 1) {
            ws.basis.col(j + 1) = ws.w / b;
        }
    }

    // coeffs = exp(h T_m) e_1
    ws.coeffs.resize(m);
    if (m == 1) {
        ws.coeffs(0) = std::exp(h * ws.alpha(0));
    } else {
        Eigen::SelfAdjointEigenSolver<Matrix> es;
        Vector diag = ws.alpha.head(m);
        Vector subdiag = ws.beta.head(m - 1);
        es.computeFromTridiagonal(diag, subdiag, Eigen::ComputeEigenvectors);
        if (es.info() != Eigen::Success) {
            throw NumericalDivergence("Lanczos tridiagonal eigensolve failed");
        }
        const Matrix& Q = es.eigenvectors();
        Vector modal = Q.row(0).transpose();
        modal.array() *= (h * es.eigenvalues().array()).exp();
        ws.coeffs.noalias() = Q * modal;
    }

    if (breakdown) {
        return 0.0;
    }
    return beta0 * next_beta * std::abs(ws.coeffs(m - 1));
}

void SparseLinearOperator::exp_action(Real tau, const Vector& x, Vector& y, KrylovWorkspace& ws) const {
    require_size(x, size(), "SparseLinearOperator::exp_action");

    y = x;
    ws.substeps = 0;
    if (tau == 0.0) {
        return;
    }

    Real remaining = tau;
    Real h = tau;
    Index rejected = 0;

    while (std::abs(remaining) > 1e-14 * std::abs(tau)) {
        const Real beta0 = y.norm();
        if (beta0 == 0.0) {
            break;
        }
        if (!std::isfinite(beta0)) {
            throw NumericalDivergence("Krylov exponential: non-finite input");
        }
        if (std::abs(h) > std::abs(remaining)) {
            h = remaining;
        }

        Index m = 0;
        const Real err = lanczos_step(h, y, beta0, ws, m);

        if (err > config_.tolerance * beta0) {
            if (++rejected > config_.max_substeps) {
                std::ostringstream oss;
                oss << "Krylov exponential did not reach tolerance " << config_.tolerance
                    << " (estimate " << err / beta0 << ", tau=" << tau << ")";
                throw NumericalDivergence(oss.str());
            }
            h *= 0.5;
            continue;
        }

        y.noalias() = beta0 * (ws.basis.leftCols(m) * ws.coeffs);
        remaining -= h;

        if (++ws.substeps > config_.max_substeps) {
            throw NumericalDivergence("Krylov exponential exceeded the sub-step budget");
        }
    }

    if (!y.allFinite()) {
        throw NumericalDivergence("Krylov exponential produced non-finite values");
    }
}

// ============================================================================
// Builders
// ============================================================================

SparseMatrix laplacian_matrix(const CartesianGrid& grid) {
    const Index nx = grid.nx();
    const Index ny = grid.ny();
    const Real inv_dx2 = 1.0 / grid.cell_area();

    std::vector<SparseTriplet> triplets;
    triplets.reserve(5 * grid.n_points());

    for (Index j = 0; j < ny; ++j) {
        for (Index i = 0; i < nx; ++i) {
            const Index p = grid.index(i, j);
            triplets.emplace_back(p, p, -4.0 * inv_dx2);
            if (i > 0)      triplets.emplace_back(p, grid.index(i - 1, j), inv_dx2);
            if (i + 1 < nx) triplets.emplace_back(p, grid.index(i + 1, j), inv_dx2);
            if (j > 0)      triplets.emplace_back(p, grid.index(i, j - 1), inv_dx2);
            if (j + 1 < ny) triplets.emplace_back(p, grid.index(i, j + 1), inv_dx2);
        }
    }

    SparseMatrix L(grid.n_points(), grid.n_points());
    L.setFromTriplets(triplets.begin(), triplets.end());
    return L;
}

Ptr<SparseLinearOperator> laplacian(const CartesianGrid& grid, Real kappa, const KrylovConfig& config) {
    return std::make_shared<SparseLinearOperator>(laplacian_matrix(grid), kappa, config);
}

} // namespace ilm
