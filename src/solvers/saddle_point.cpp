/**
 * @file saddle_point.cpp
 * @brief Schur-complement saddle-point solver
 */

#include "ilm/solvers/saddle_point.hpp"
#include "ilm/core/errors.hpp"
#include <chrono>
#include <iostream>
#include <sstream>
#include <algorithm>
#include <cmath>

namespace ilm {

// ============================================================================
// SchurOperator
// ============================================================================

SchurOperator::SchurOperator(const ConstrainedODEFunction& f, const ExpPropagator& propagator,
                             const Vector& weights, Real breakdown_tolerance)
    : f_(f)
    , propagator_(propagator)
    , weights_(weights)
    , breakdown_tolerance_(breakdown_tolerance)
    , input_(Vector::Zero(weights.size()))
    , output_(Vector::Zero(weights.size()))
    , sigma_(SurfaceField::zeros_like(f.prototype().constraint))
    , surface_(SurfaceField::zeros_like(f.prototype().constraint))
    , force_(GridField::zeros_like(f.prototype().state))
    , response_(GridField::zeros_like(f.prototype().state))
{}

void SchurOperator::apply(const Vector& x, Vector& y) const {
    const Real norm = x.norm();
    if (!std::isfinite(norm)) {
        throw SingularSystem("Conjugate gradient broke down on the Schur complement (non-finite iterate)");
    }
    if (norm == 0.0) {
        y.setZero();
        return;
    }

    sigma_.values() = x / norm;
    f_.constraint_force(force_, sigma_);
    propagator_.apply(force_.values(), response_.values());
    if (!response_.all_finite()) {
        throw NumericalDivergence("Exponential action produced non-finite values in the Schur operator");
    }
    f_.constraint_op(surface_, response_);
    // B = -constraint_force
    y = -weights_.cwiseProduct(surface_.values());

    if (breakdown_tolerance_ > 0.0) {
        const Real curvature = sigma_.values().dot(y);
        max_curvature_ = std::max(max_curvature_, curvature);
        if (curvature <= breakdown_tolerance_ * max_curvature_) {
            std::ostringstream oss;
            oss << "Conjugate gradient broke down on the Schur complement (curvature "
                << curvature << ", largest seen " << max_curvature_ << ")";
            throw SingularSystem(oss.str());
        }
    }

    y *= norm;
}

Matrix SchurOperator::assemble() const {
    const Eigen::Index n = rows();
    Matrix S(n, n);
    Vector e = Vector::Zero(n);
    Vector col(n);
    for (Eigen::Index k = 0; k < n; ++k) {
        e(k) = 1.0;
        apply(e, col);
        S.col(k) = col;
        e(k) = 0.0;
    }
    return S;
}

// ============================================================================
// SaddlePointSolver
// ============================================================================

SaddlePointSolver::SaddlePointSolver(const ConstrainedODEFunction& f, const SchurConfig& config)
    : f_(f)
    , config_(config)
    , hr_(GridField::zeros_like(f.prototype().state))
    , force_(GridField::zeros_like(f.prototype().state))
    , constraint_(SurfaceField::zeros_like(f.prototype().constraint))
    , rhs_(Vector::Zero(f.n_constraint()))
    , guess_(Vector::Zero(f.n_constraint()))
{
    const SurfaceField& proto = f.prototype().constraint;
    const Vector& w = f.inner_products().surface_weights;
    weights_ = Vector::Ones(proto.size());
    if (w.size() != 0) {
        const Index nc = proto.n_components();
        for (Index k = 0; k < proto.n_points(); ++k) {
            weights_.segment(k * nc, nc).setConstant(w(k));
        }
    }
}

SchurSolveMethod SaddlePointSolver::method() const {
    if (config_.method == SchurSolveMethod::Auto) {
        return f_.n_constraint() <= config_.dense_threshold
            ? SchurSolveMethod::Direct
            : SchurSolveMethod::ConjugateGradient;
    }
    return config_.method;
}

std::string SaddlePointSolver::info() const {
    std::ostringstream oss;
    oss << "Schur solver (" << f_.n_constraint() << " multipliers, method="
        << (method() == SchurSolveMethod::Direct ? "Direct LDLT" : "Eigen CG")
        << ", cached factorizations=" << factorizations_.size() << ")";
    return oss.str();
}

const SaddlePointSolver::DenseSchur& SaddlePointSolver::factorization(const ExpPropagator& propagator) {
    auto it = factorizations_.find(&propagator);
    if (it != factorizations_.end()) {
        return it->second;
    }

    SchurOperator op(f_, propagator, weights_);
    DenseSchur dense;
    dense.matrix = op.assemble();

    const Real norm = dense.matrix.norm();
    dense.asymmetry = (dense.matrix - dense.matrix.transpose()).norm() / (norm + constants::EPSILON);
    last_asymmetry_ = dense.asymmetry;
    if (dense.asymmetry > config_.symmetry_tolerance) {
        std::cerr << "WARNING: Schur complement asymmetry " << dense.asymmetry
                  << " exceeds " << config_.symmetry_tolerance
                  << " (constraint_op is not the adjoint of -constraint_force)\n";
    }

    dense.ldlt.compute(dense.matrix);
    if (dense.ldlt.info() != Eigen::Success) {
        throw SingularSystem("LDLT factorization of the Schur complement failed");
    }
    // A trailing zero pivot still reports Success; Eigen then drops it from solves
    const Vector pivots = dense.ldlt.vectorD().cwiseAbs();
    if (!(pivots.minCoeff() > config_.singular_rcond * pivots.maxCoeff())) {
        std::ostringstream oss;
        oss << "Schur complement is singular (smallest LDLT pivot " << pivots.minCoeff()
            << ", largest " << pivots.maxCoeff() << ")";
        throw SingularSystem(oss.str());
    }
    dense.rcond = dense.ldlt.rcond();
    if (!(dense.rcond >= config_.singular_rcond)) {
        std::ostringstream oss;
        oss << "Schur complement is singular (rcond=" << dense.rcond
            << " < " << config_.singular_rcond << ")";
        throw SingularSystem(oss.str());
    }

    if (config_.verbose) {
        std::cerr << "Schur: factorized " << dense.matrix.rows() << "x" << dense.matrix.cols()
                  << " complement (tau=" << propagator.tau() << ", rcond=" << dense.rcond
                  << ", asymmetry=" << dense.asymmetry << ")\n";
    }

    return factorizations_.emplace(&propagator, std::move(dense)).first->second;
}

SolveResult SaddlePointSolver::solve_direct(const ExpPropagator& propagator, SurfaceField& sigma) {
    SolveResult result;
    const DenseSchur& dense = factorization(propagator);

    sigma.values() = dense.ldlt.solve(rhs_);

    const Real rhs_norm = rhs_.norm();
    result.final_residual = (dense.matrix * sigma.values() - rhs_).norm() / (rhs_norm + constants::EPSILON);
    result.converged = true;
    result.iterations = 0;
    result.message = "Direct LDLT";
    return result;
}

SolveResult SaddlePointSolver::solve_cg(const ExpPropagator& propagator, SurfaceField& sigma) {
    SolveResult result;

    SchurOperator op(f_, propagator, weights_, config_.singular_rcond);
    Eigen::ConjugateGradient<SchurOperator, Eigen::Lower | Eigen::Upper,
                             Eigen::IdentityPreconditioner> cg;
    cg.setMaxIterations(config_.max_iterations);
    cg.setTolerance(config_.tolerance);
    cg.compute(op);

    guess_ = sigma.values();
    if (!guess_.allFinite()) {
        guess_.setZero();
    }

    sigma.values() = cg.solveWithGuess(rhs_, guess_);
    result.iterations = cg.iterations();
    result.final_residual = cg.error();
    result.converged = (cg.info() == Eigen::Success);

    std::ostringstream oss;
    oss << "Eigen CG (iters=" << result.iterations << ", error=" << result.final_residual << ")";
    if (!result.converged) {
        oss << ": iteration budget " << config_.max_iterations << " exhausted";
    }
    result.message = oss.str();
    return result;
}

SolveResult SaddlePointSolver::solve(const ExpPropagator& propagator,
                                     const GridField& r_state,
                                     const SurfaceField& r_constraint,
                                     GridField& x,
                                     SurfaceField& sigma,
                                     GridField& force_response) {
    auto start_time = std::chrono::high_resolution_clock::now();

    const CoupledState& proto = f_.prototype();
    if (!r_state.same_shape(proto.state) || !x.same_shape(proto.state) ||
        !force_response.same_shape(proto.state)) {
        throw ConfigurationError("Saddle-point solve: grid buffers do not match the state prototype");
    }
    if (!r_constraint.same_shape(proto.constraint) || !sigma.same_shape(proto.constraint)) {
        throw ConfigurationError("Saddle-point solve: surface buffers do not match the constraint prototype");
    }

    // A^{-1} r_state
    propagator.apply(r_state.values(), hr_.values());
    if (!hr_.all_finite()) {
        throw NumericalDivergence("Exponential action produced non-finite values");
    }

    SolveResult result;

    if (!f_.has_constraint()) {
        x.assign(hr_);
        force_response.set_zero();
        result.converged = true;
        result.message = "No constraint";
        return result;
    }

    // W_s (B^T A^{-1} r_state - r_constraint)
    f_.constraint_op(constraint_, hr_);
    rhs_ = weights_.cwiseProduct(constraint_.values() - r_constraint.values());

    if ((rhs_.array() == 0.0).all()) {
        sigma.set_zero();
        force_response.set_zero();
        x.assign(hr_);
        result.converged = true;
        result.message = "Zero reduced right-hand side";
        return result;
    }

    if (method() == SchurSolveMethod::Direct) {
        result = solve_direct(propagator, sigma);
    } else {
        result = solve_cg(propagator, sigma);
    }

    if (!sigma.all_finite()) {
        throw SingularSystem("Schur solve produced non-finite multipliers");
    }

    // x = A^{-1} r_state - A^{-1} B sigma
    f_.constraint_force(force_, sigma);
    propagator.apply(force_.values(), force_response.values());
    if (!force_response.all_finite()) {
        throw NumericalDivergence("Exponential action produced non-finite values");
    }
    x.assign(hr_);
    x += force_response;

    auto end = std::chrono::high_resolution_clock::now();
    result.solve_time_ms = std::chrono::duration<double, std::milli>(end - start_time).count();

    if (config_.verbose) {
        std::cerr << "Schur solve: " << result.message
                  << ", residual=" << result.final_residual
                  << ", time=" << result.solve_time_ms << " ms\n";
    }

    return result;
}

} // namespace ilm
