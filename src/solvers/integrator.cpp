/**
 * @file integrator.cpp
 * @brief IF-HERK time integrator implementation
 */

#include "ilm/solvers/integrator.hpp"
#include "ilm/core/errors.hpp"
#include <iostream>
#include <sstream>
#include <cmath>

namespace ilm {

// ============================================================================
// Tableau
// ============================================================================

Tableau Tableau::create(TimeMarchingScheme scheme) {
    Tableau tab;
    tab.scheme = scheme;

    switch (scheme) {
        case TimeMarchingScheme::IFHEEuler:
            tab.stages = 1;
            tab.order = 1;
            tab.a = Matrix::Ones(1, 1);
            tab.c = Vector::Ones(1);
            break;

        case TimeMarchingScheme::LiskaIFHERK: {
            const Real s3 = std::sqrt(3.0);
            tab.stages = 3;
            tab.order = 2;
            tab.a = Matrix::Zero(3, 3);
            tab.a(0, 0) = 0.5;
            tab.a(1, 0) = s3 / 3.0;
            tab.a(1, 1) = (3.0 - s3) / 3.0;
            tab.a(2, 0) = (3.0 + s3) / 6.0;
            tab.a(2, 1) = -s3 / 3.0;
            tab.a(2, 2) = (3.0 + s3) / 6.0;
            tab.c.resize(3);
            tab.c << 0.5, 1.0, 1.0;
            break;
        }

        default:
            throw ConfigurationError("Unknown time marching scheme");
    }
    return tab;
}

// ============================================================================
// Construction
// ============================================================================

Integrator::Integrator(const CoupledState& u0,
                       std::pair<Real, Real> tspan,
                       Ptr<const ConstrainedODEFunction> f,
                       Real dt,
                       const IntegratorConfig& config,
                       const SchurConfig& schur)
    : f_(std::move(f))
    , tableau_(Tableau::create(config.scheme))
    , config_(config)
    , t0_(tspan.first)
    , tf_(tspan.second)
    , t_(tspan.first)
    , dt_(dt)
{
    if (!f_) {
        throw ConfigurationError("Integrator requires a ConstrainedODEFunction");
    }
    if (!(tf_ > t0_)) {
        throw ConfigurationError("Time span end must be greater than its start");
    }
    if (!(dt_ > 0.0) || !std::isfinite(dt_)) {
        std::ostringstream oss;
        oss << "Time step must be positive and finite (got " << dt_ << ")";
        throw ConfigurationError(oss.str());
    }
    if (!u0.same_shape(f_->prototype())) {
        throw ConfigurationError("Initial state does not match the ConstrainedODEFunction prototype");
    }
    if (!u0.all_finite()) {
        throw ConfigurationError("Initial state contains non-finite values");
    }

    u_ = u0;
    allocate_scratch();

    solver_ = std::make_unique<SaddlePointSolver>(*f_, schur);
    build_propagators();

    status_ = IntegratorStatus::Ready;

    if (config_.verbose) {
        std::cerr << "Integrator: " << config_io::to_string(tableau_.scheme)
                  << ", dt=" << dt_ << ", span=[" << t0_ << ", " << tf_ << "], "
                  << f_->linear_operator().info() << ", " << solver_->info() << "\n";
    }
}

Integrator::Integrator(const CoupledState& u0,
                       std::pair<Real, Real> tspan,
                       Ptr<const ConstrainedODEFunction> f,
                       const StepSizeFunction& dt_function,
                       const IntegratorConfig& config,
                       const SchurConfig& schur)
    : Integrator(u0, tspan, std::move(f),
                 dt_function ? dt_function() : Real(0.0),
                 config, schur)
{}

void Integrator::allocate_scratch() {
    const CoupledState& proto = f_->prototype();

    next_ = CoupledState::zeros_like(proto);
    q_ = GridField::zeros_like(proto.state);
    stage_ = GridField::zeros_like(proto.state);
    rhat_ = GridField::zeros_like(proto.state);
    forcing_ = GridField::zeros_like(proto.state);
    response_ = GridField::zeros_like(proto.state);
    tmp_ = GridField::zeros_like(proto.state);
    target_ = SurfaceField::zeros_like(proto.constraint);
    mu_ = SurfaceField::zeros_like(proto.constraint);

    w_.clear();
    for (Index i = 0; i < tableau_.stages; ++i) {
        w_.push_back(GridField::zeros_like(proto.state));
    }
}

void Integrator::build_propagators() {
    propagators_.clear();
    stage_propagator_.clear();
    final_propagators_.clear();
    final_stage_propagator_.clear();
    final_dt_ = 0.0;
    solver_->clear_cache();

    make_stage_propagators(dt_, propagators_, stage_propagator_);
}

void Integrator::make_stage_propagators(Real h,
                                        std::vector<UniquePtr<ExpPropagator>>& owned,
                                        std::vector<const ExpPropagator*>& per_stage) const {
    const LinearOperator& A = f_->linear_operator();
    Real c_prev = 0.0;
    for (Index i = 0; i < tableau_.stages; ++i) {
        const Real tau = (tableau_.c(i) - c_prev) * h;
        c_prev = tableau_.c(i);

        const ExpPropagator* found = nullptr;
        for (const auto& p : owned) {
            if (p->tau() == tau) {
                found = p.get();
                break;
            }
        }
        if (!found) {
            owned.push_back(A.propagator(tau));
            found = owned.back().get();
        }
        per_stage.push_back(found);
    }
}

const std::vector<const ExpPropagator*>& Integrator::final_propagators(Real h) {
    if (h != final_dt_) {
        // Factorizations are keyed by propagator address
        solver_->clear_cache();
        final_propagators_.clear();
        final_stage_propagator_.clear();
        make_stage_propagators(h, final_propagators_, final_stage_propagator_);
        final_dt_ = h;
        if (config_.verbose) {
            std::cerr << "Integrator: final step shortened to " << h << "\n";
        }
    }
    return final_stage_propagator_;
}

// ============================================================================
// Stepping
// ============================================================================

bool Integrator::finished() const {
    return t_ >= tf_ - 1e-9 * dt_;
}

bool Integrator::perform_step(Real h, const std::vector<const ExpPropagator*>& propagators,
                              StepResult& result) {
    const Tableau& tab = tableau_;
    const Index s = tab.stages;
    const Real tn = t_;

    q_.assign(u_.state);
    stage_.assign(u_.state);
    Real t_prev = tn;

    for (Index i = 0; i < s; ++i) {
        const ExpPropagator& H = *propagators[i];
        const Real aii = tab.a(i, i);
        const Real t_stage = tn + tab.c(i) * h;

        // dt N(U_{i-1})
        f_->state_rhs(forcing_, stage_, t_prev);
        forcing_ *= h;

        rhat_.assign(q_);
        for (Index j = 0; j < i; ++j) {
            rhat_.axpy(tab.a(i, j), w_[j]);
        }
        rhat_.axpy(aii, forcing_);

        f_->constraint_rhs(target_, t_stage);

        // Warm start from the committed multiplier
        mu_.values() = (aii * h) * u_.constraint.values();

        last_solve_ = solver_->solve(H, rhat_, target_, stage_, mu_, response_);
        result.schur_iterations += last_solve_.iterations;
        result.last_residual = last_solve_.final_residual;
        if (!last_solve_.converged) {
            result.message = last_solve_.message;
            return false;
        }

        // w_i, then carry the earlier stage contributions and q forward
        H.apply(forcing_.values(), w_[i].values());
        w_[i].axpy(1.0 / aii, response_);
        for (Index j = 0; j < i; ++j) {
            H.apply(w_[j].values(), tmp_.values());
            w_[j].values().swap(tmp_.values());
        }
        H.apply(q_.values(), tmp_.values());
        q_.values().swap(tmp_.values());

        if (!q_.all_finite() || !w_[i].all_finite()) {
            throw NumericalDivergence("Exponential action produced non-finite values");
        }

        t_prev = t_stage;
    }

    next_.state.assign(stage_);
    next_.constraint.values() = mu_.values() / (tab.a(s - 1, s - 1) * h);
    return true;
}

StepResult Integrator::step() {
    StepResult result;
    result.time = t_;

    if (status_ == IntegratorStatus::Failed) {
        throw Error("Integrator is in the Failed state; call reinit() before stepping");
    }
    if (status_ == IntegratorStatus::Finished || finished()) {
        status_ = IntegratorStatus::Finished;
        result.success = false;
        result.message = "End of time span reached";
        return result;
    }

    // The last step is shortened to land on the end of the span
    Real h = dt_;
    const std::vector<const ExpPropagator*>* propagators = &stage_propagator_;
    if (t_ + dt_ > tf_ + 1e-9 * dt_) {
        h = tf_ - t_;
        propagators = &final_propagators(h);
    }

    status_ = IntegratorStatus::Stepping;
    bool ok = false;
    try {
        ok = perform_step(h, *propagators, result);
    } catch (...) {
        status_ = IntegratorStatus::Failed;
        throw;
    }

    if (!ok) {
        status_ = IntegratorStatus::Ready;
        result.success = false;
        if (config_.verbose) {
            std::cerr << "Integrator: step at t=" << t_ << " not taken: " << result.message << "\n";
        }
        return result;
    }

    // Commit
    u_.assign(next_);
    t_ += h;
    if (std::abs(tf_ - t_) <= 1e-9 * dt_) {
        t_ = tf_;
    }
    ++steps_;

    result.success = true;
    result.steps_taken = 1;
    result.time = t_;
    status_ = finished() ? IntegratorStatus::Finished : IntegratorStatus::Ready;

    if (config_.verbose) {
        std::cerr << "Step " << steps_ << ": t=" << t_
                  << ", |u|max=" << u_.state.max_abs()
                  << ", |lambda|max=" << u_.constraint.max_abs()
                  << ", schur=" << last_solve_.message << "\n";
    }

    if (output_callback_) {
        output_callback_(*this);
    }
    return result;
}

StepResult Integrator::advance_steps(Index n) {
    StepResult total;
    total.success = true;
    total.time = t_;

    for (Index k = 0; k < n; ++k) {
        if (status_ == IntegratorStatus::Finished || finished()) {
            status_ = IntegratorStatus::Finished;
            break;
        }
        StepResult r = step();
        total.schur_iterations += r.schur_iterations;
        total.last_residual = r.last_residual;
        total.time = r.time;
        if (!r.success) {
            total.success = false;
            total.message = r.message;
            return total;
        }
        ++total.steps_taken;
    }
    return total;
}

StepResult Integrator::advance_to(Real target) {
    StepResult total;
    total.success = true;
    total.time = t_;

    while (t_ < target - 1e-9 * dt_) {
        if (status_ == IntegratorStatus::Finished || finished()) {
            status_ = IntegratorStatus::Finished;
            break;
        }
        StepResult r = step();
        total.schur_iterations += r.schur_iterations;
        total.last_residual = r.last_residual;
        total.time = r.time;
        if (!r.success) {
            total.success = false;
            total.message = r.message;
            return total;
        }
        ++total.steps_taken;
    }
    return total;
}

StepResult Integrator::advance(Real duration) {
    if (duration < 0.0) {
        throw ConfigurationError("advance() requires a non-negative duration");
    }
    return advance_to(t_ + duration);
}

void Integrator::reinit(const CoupledState& u0) {
    if (status_ == IntegratorStatus::Stepping) {
        throw Error("Cannot reinit while stepping");
    }
    if (!u0.same_shape(f_->prototype())) {
        throw ConfigurationError("Initial state does not match the ConstrainedODEFunction prototype");
    }
    if (!u0.all_finite()) {
        throw ConfigurationError("Initial state contains non-finite values");
    }
    u_.assign(u0);
    t_ = t0_;
    steps_ = 0;
    last_solve_ = SolveResult{};
    status_ = IntegratorStatus::Ready;
}

void Integrator::set_dt(Real dt) {
    if (status_ == IntegratorStatus::Stepping) {
        throw Error("Cannot change the time step while stepping");
    }
    if (!(dt > 0.0) || !std::isfinite(dt)) {
        throw ConfigurationError("Time step must be positive and finite");
    }
    if (dt == dt_) {
        return;
    }
    dt_ = dt;
    build_propagators();
    if (status_ == IntegratorStatus::Finished && !finished()) {
        status_ = IntegratorStatus::Ready;
    }
}

} // namespace ilm
