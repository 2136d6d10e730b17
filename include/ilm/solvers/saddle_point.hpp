/**
 * @file saddle_point.hpp
 * @brief Schur-complement solver for the stage saddle-point system
 *
 * Solves
 *
 *   [ A   B ] [ x     ]   [ r_state      ]
 *   [ B^T 0 ] [ sigma ] = [ r_constraint ]
 *
 * with A^{-1} = exp(tau L) supplied as an ExpPropagator, B = -constraint_force
 * and B^T = constraint_op. Eliminating x gives
 *
 *   S sigma = B^T A^{-1} r_state - r_constraint,   S = B^T A^{-1} B
 *   x = A^{-1} r_state - A^{-1} B sigma
 *
 * S is symmetric under the surface inner product. Both sides are multiplied
 * by the surface weights W_s before solving, so the system handed to Eigen
 * is symmetric in the Euclidean sense:
 *
 *   (W_s S) sigma = W_s (B^T A^{-1} r_state - r_constraint)
 *
 * Supports:
 * - Direct: dense W_s S assembled column by column, Eigen LDLT, cached per propagator
 * - ConjugateGradient: matrix-free Eigen CG on W_s S
 * - Auto: direct up to SchurConfig::dense_threshold surface unknowns
 */

#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../core/field.hpp"
#include "constrained_ode.hpp"
#include "linear_operator.hpp"
#include <Eigen/Dense>
#include <Eigen/IterativeLinearSolvers>
#include <unordered_map>

namespace ilm {
class SchurOperator;
} // namespace ilm

// ============================================================================
// Eigen glue for the matrix-free operator
// ============================================================================

namespace Eigen {
namespace internal {

template<>
struct traits<ilm::SchurOperator> : public Eigen::internal::traits<Eigen::SparseMatrix<double>> {};

} // namespace internal
} // namespace Eigen

namespace ilm {

/**
 * @brief Matrix-free W_s S for use with Eigen's iterative solvers
 *
 * Applying it costs one constraint_force, one exponential action and one
 * constraint_op. The callbacks always see a unit-norm multiplier; the
 * result is scaled back afterwards. Scratch buffers are owned here, so one
 * instance must not be used from two threads at once.
 *
 * With a positive breakdown tolerance every application also checks the
 * Rayleigh quotient of its input. A non-finite input, or a quotient at or
 * below tolerance times the largest one seen so far, means S is singular
 * (or indefinite) along that direction and SingularSystem is thrown.
 */
class SchurOperator : public Eigen::EigenBase<SchurOperator> {
public:
    using Scalar = double;
    using RealScalar = double;
    using StorageIndex = int;
    enum {
        ColsAtCompileTime = Eigen::Dynamic,
        MaxColsAtCompileTime = Eigen::Dynamic,
        IsRowMajor = false
    };

    SchurOperator(const ConstrainedODEFunction& f, const ExpPropagator& propagator,
                  const Vector& weights, Real breakdown_tolerance = 0.0);

    Eigen::Index rows() const { return weights_.size(); }
    Eigen::Index cols() const { return weights_.size(); }

    template<typename Rhs>
    Eigen::Product<SchurOperator, Rhs, Eigen::AliasFreeProduct>
    operator*(const Eigen::MatrixBase<Rhs>& x) const {
        return Eigen::Product<SchurOperator, Rhs, Eigen::AliasFreeProduct>(*this, x.derived());
    }

    /// y = W_s S x
    void apply(const Vector& x, Vector& y) const;

    /// dst += alpha W_s S x, through the operator's own buffers
    template<typename Rhs, typename Dest>
    void apply_add(const Rhs& x, Dest& dst, Real alpha) const {
        input_ = x;
        apply(input_, output_);
        dst.noalias() += alpha * output_;
    }

    /// Dense W_s S, one application per column
    Matrix assemble() const;

private:
    const ConstrainedODEFunction& f_;
    const ExpPropagator& propagator_;
    const Vector& weights_;
    Real breakdown_tolerance_ = 0.0;

    mutable Real max_curvature_ = 0.0;
    mutable Vector input_;
    mutable Vector output_;
    mutable SurfaceField sigma_;
    mutable SurfaceField surface_;
    mutable GridField force_;
    mutable GridField response_;
};

} // namespace ilm

namespace Eigen {
namespace internal {

template<typename Rhs>
struct generic_product_impl<ilm::SchurOperator, Rhs, SparseShape, DenseShape, GemvProduct>
    : generic_product_impl_base<ilm::SchurOperator, Rhs,
                                generic_product_impl<ilm::SchurOperator, Rhs>> {
    using Scalar = typename Product<ilm::SchurOperator, Rhs>::Scalar;

    template<typename Dest>
    static void scaleAndAddTo(Dest& dst, const ilm::SchurOperator& lhs, const Rhs& rhs,
                              const Scalar& alpha) {
        lhs.apply_add(rhs, dst, alpha);
    }
};

} // namespace internal
} // namespace Eigen

namespace ilm {

/**
 * @brief Schur-complement solver bound to one ConstrainedODEFunction
 *
 * Holds preallocated scratch and the dense factorizations, keyed by the
 * propagator they were built for. Propagators must outlive the solver
 * (the integrator owns both).
 */
class SaddlePointSolver {
public:
    SaddlePointSolver(const ConstrainedODEFunction& f, const SchurConfig& config = {});

    /**
     * @brief Solve one saddle-point system
     *
     * @param propagator      A^{-1}
     * @param r_state         Grid right-hand side
     * @param r_constraint    Surface right-hand side
     * @param x               Output state (preallocated)
     * @param sigma           Output multiplier (preallocated); CG uses it as initial guess
     * @param force_response  Output -A^{-1} B sigma, i.e. the part of x due to sigma
     *
     * @throws SingularSystem if S cannot be inverted (failed or ill-conditioned
     *         LDLT, or CG breakdown on a vanishing or negative curvature)
     * @throws NumericalDivergence if a callback or the exponential produces NaN/Inf
     *
     * An exhausted CG iteration budget is not thrown; it is reported with
     * converged = false and the last iterate is returned.
     */
    SolveResult solve(const ExpPropagator& propagator,
                      const GridField& r_state,
                      const SurfaceField& r_constraint,
                      GridField& x,
                      SurfaceField& sigma,
                      GridField& force_response);

    /// Method that will actually be used (Auto resolved)
    SchurSolveMethod method() const;

    /// Drop cached factorizations (call after a propagator changes)
    void clear_cache() { factorizations_.clear(); }

    /// Relative asymmetry ||S - S^T|| / ||S|| of the last assembled complement
    Real last_asymmetry() const { return last_asymmetry_; }

    const SchurConfig& config() const { return config_; }

    std::string info() const;

private:
    struct DenseSchur {
        Matrix matrix;
        Eigen::LDLT<Matrix> ldlt;
        Real asymmetry = 0.0;
        Real rcond = 0.0;
    };

    const ConstrainedODEFunction& f_;
    SchurConfig config_;
    Vector weights_;                // per-entry surface weights

    std::unordered_map<const ExpPropagator*, DenseSchur> factorizations_;
    Real last_asymmetry_ = 0.0;

    // Scratch
    GridField hr_;
    GridField force_;
    SurfaceField constraint_;
    Vector rhs_;
    Vector guess_;

    const DenseSchur& factorization(const ExpPropagator& propagator);
    SolveResult solve_direct(const ExpPropagator& propagator, SurfaceField& sigma);
    SolveResult solve_cg(const ExpPropagator& propagator, SurfaceField& sigma);
};

} // namespace ilm
