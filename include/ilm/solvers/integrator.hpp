/**
 * @file integrator.hpp
 * @brief Integrating-factor half-explicit Runge-Kutta time integrator
 *
 * Advances a CoupledState under a ConstrainedODEFunction with a fixed step.
 * When the span is not a whole number of steps, the last step is shortened
 * to end exactly on the end of the span.
 * The linear operator is handled exactly through its exponential; the
 * remaining forcing is explicit, and every stage ends with one
 * saddle-point solve that enforces the constraint at the stage time.
 *
 * Stage i of an s-stage scheme with coefficients a_ij, nodes c_i (c_0 = 0),
 * H_i = exp((c_i - c_{i-1}) dt A) and q_0 = u_n:
 *
 *   r_i = q_{i-1} + sum_{j<i} a_ij w_j + a_ii dt N(U_{i-1}, t_n + c_{i-1} dt)
 *   U_i = H_i r_i + H_i F(mu_i),   C U_i = g(t_n + c_i dt)
 *   w_i = H_i (dt N(U_{i-1})) + H_i F(mu_i) / a_ii,   w_j <- H_i w_j (j < i)
 *   q_i = H_i q_{i-1}
 *
 * with N = state_rhs, F = constraint_force, C = constraint_op,
 * g = constraint_rhs and mu_i = a_ii dt lambda_i. u_{n+1} = U_s and the
 * stored multiplier is lambda_s.
 *
 * Schemes:
 * - IFHEEuler: s = 1, a = [1], c = [1]; first order
 * - LiskaIFHERK: s = 3 (Liska & Colonius); second order
 */

#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../core/state.hpp"
#include "constrained_ode.hpp"
#include "linear_operator.hpp"
#include "saddle_point.hpp"
#include <utility>

namespace ilm {

/**
 * @brief Butcher-type coefficients of an IF-HERK scheme
 */
struct Tableau {
    TimeMarchingScheme scheme = TimeMarchingScheme::LiskaIFHERK;
    Index stages = 0;
    Index order = 0;
    Matrix a;                       ///< Lower-triangular [s x s], nonzero diagonal
    Vector c;                       ///< Stage nodes, nondecreasing, c(s-1) = 1

    static Tableau create(TimeMarchingScheme scheme);
};

class Integrator {
public:
    /// Evaluated once, before the first step, to obtain dt
    using StepSizeFunction = std::function<Real()>;

    /// Called after every committed step
    using OutputCallback = std::function<void(const Integrator&)>;

    /**
     * @brief Construct with a fixed step
     *
     * Validates shapes, builds one exponential propagator per distinct
     * stage interval and leaves the integrator Ready.
     *
     * @throws ConfigurationError on invalid step, span or initial state
     */
    Integrator(const CoupledState& u0,
               std::pair<Real, Real> tspan,
               Ptr<const ConstrainedODEFunction> f,
               Real dt,
               const IntegratorConfig& config = {},
               const SchurConfig& schur = {});

    /// Construct with a step derived from dt_function()
    Integrator(const CoupledState& u0,
               std::pair<Real, Real> tspan,
               Ptr<const ConstrainedODEFunction> f,
               const StepSizeFunction& dt_function,
               const IntegratorConfig& config = {},
               const SchurConfig& schur = {});

    // ------------------------------------------------------------------
    // Advancing
    // ------------------------------------------------------------------

    /// One step of size dt(), or the remainder of the span if that is shorter
    StepResult step();

    /// Step until time() >= time() + duration (or the end of the span)
    StepResult advance(Real duration);

    /// Up to n steps (fewer if the end of the span is reached)
    StepResult advance_steps(Index n);

    /// Step until time() >= target (or the end of the span)
    StepResult advance_to(Real target);

    /// Reset to a new initial state at the start of the span
    void reinit(const CoupledState& u0);

    /// Replace the step size (rebuilds the propagators)
    void set_dt(Real dt);

    void set_output_callback(OutputCallback callback) { output_callback_ = std::move(callback); }

    // ------------------------------------------------------------------
    // Accessors
    // ------------------------------------------------------------------

    const CoupledState& state() const { return u_; }
    Real time() const { return t_; }
    Real dt() const { return dt_; }
    std::pair<Real, Real> tspan() const { return {t0_, tf_}; }
    IntegratorStatus status() const { return status_; }
    Index steps_taken() const { return steps_; }
    const SolveResult& last_step() const { return last_solve_; }
    const Tableau& tableau() const { return tableau_; }
    const ConstrainedODEFunction& function() const { return *f_; }
    const SaddlePointSolver& saddle_solver() const { return *solver_; }

private:
    Ptr<const ConstrainedODEFunction> f_;
    Tableau tableau_;
    IntegratorConfig config_;

    Real t0_ = 0.0;
    Real tf_ = 0.0;
    Real t_ = 0.0;
    Real dt_ = 0.0;
    Index steps_ = 0;
    IntegratorStatus status_ = IntegratorStatus::Uninitialized;

    CoupledState u_;                // committed state
    SolveResult last_solve_;
    OutputCallback output_callback_;

    UniquePtr<SaddlePointSolver> solver_;
    std::vector<UniquePtr<ExpPropagator>> propagators_;     // one per distinct interval
    std::vector<const ExpPropagator*> stage_propagator_;    // per stage

    // Shortened last step
    Real final_dt_ = 0.0;
    std::vector<UniquePtr<ExpPropagator>> final_propagators_;
    std::vector<const ExpPropagator*> final_stage_propagator_;

    // Scratch (allocated once)
    CoupledState next_;
    GridField q_;
    GridField stage_;
    GridField rhat_;
    GridField forcing_;
    GridField response_;
    GridField tmp_;
    std::vector<GridField> w_;
    SurfaceField target_;
    SurfaceField mu_;

    void build_propagators();
    void make_stage_propagators(Real h,
                                std::vector<UniquePtr<ExpPropagator>>& owned,
                                std::vector<const ExpPropagator*>& per_stage) const;
    const std::vector<const ExpPropagator*>& final_propagators(Real h);
    void allocate_scratch();
    bool finished() const;

    /// Advance next_ from u_ by a step of size h; returns false on Schur non-convergence
    bool perform_step(Real h, const std::vector<const ExpPropagator*>& propagators,
                      StepResult& result);
};

} // namespace ilm
