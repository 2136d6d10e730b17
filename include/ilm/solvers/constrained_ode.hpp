/**
 * @file constrained_ode.hpp
 * @brief Linear-plus-Lagrange-multiplier ODE system
 *
 * Describes
 *
 *   du/dt = A u + state_rhs(u, t) + constraint_force(sigma)
 *   constraint_op(u) = constraint_rhs(t)
 *
 * with A a LinearOperator handled by its exponential. constraint_op must be
 * the adjoint of constraint_force up to sign under the attached inner
 * products:
 *
 *   <constraint_op(x), s>_surface = -<x, constraint_force(s)>_grid
 *
 * which is what makes the Schur complement symmetric. The typical pairing
 * constraint_force = -regularize, constraint_op = interpolate satisfies it.
 *
 * All callbacks follow "caller allocates, callee overwrites": the output
 * buffer already has the prototype's shape and must be fully overwritten.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../core/field.hpp"
#include "../core/state.hpp"
#include "linear_operator.hpp"

namespace ilm {

class ConstrainedODEFunction {
public:
    /// out = non-stiff part of du/dt (excludes A u and the constraint force)
    using StateRHS = std::function<void(GridField& out, const GridField& u, Real t)>;

    /// out = target of the constraint equation at time t
    using ConstraintRHS = std::function<void(SurfaceField& out, Real t)>;

    /// out = grid contribution of the multiplier sigma
    using ConstraintForce = std::function<void(GridField& out, const SurfaceField& sigma)>;

    /// out = surface sampling of the grid state u
    using ConstraintOp = std::function<void(SurfaceField& out, const GridField& u)>;

    struct Operators {
        StateRHS state_rhs;
        ConstraintRHS constraint_rhs;
        ConstraintForce constraint_force;
        ConstraintOp constraint_op;
    };

    /**
     * @brief Bundle the callbacks with the linear operator
     *
     * Every callback is invoked once on zero data to validate output shapes
     * against the prototype. When config.check_adjoint is set the adjoint
     * pairing is sampled as well.
     *
     * @throws ConfigurationError on a missing callback, a shape mismatch or
     *         an adjoint mismatch above config.adjoint_tolerance
     */
    ConstrainedODEFunction(Operators operators,
                           Ptr<const LinearOperator> linear,
                           const CoupledState& prototype,
                           InnerProducts inner = {},
                           const ConstraintConfig& config = {});

    // ------------------------------------------------------------------
    // Checked evaluation
    //
    // Each wrapper calls the user callback and verifies the result:
    // wrong shape -> ConfigurationError, NaN/Inf -> NumericalDivergence.
    // ------------------------------------------------------------------

    void state_rhs(GridField& out, const GridField& u, Real t) const;
    void constraint_rhs(SurfaceField& out, Real t) const;
    void constraint_force(GridField& out, const SurfaceField& sigma) const;
    void constraint_op(SurfaceField& out, const GridField& u) const;

    /**
     * @brief Sampled adjoint consistency check
     *
     * Draws seeded random x and s and returns the largest relative mismatch
     *   |<op(x), s>_S + <x, force(s)>_G| / (|op(x)|_S |s|_S + |x|_G |force(s)|_G)
     * over the samples. Zero for an exactly consistent pair.
     */
    Real check_adjoint(Index samples = 3, unsigned seed = 12345) const;

    // ------------------------------------------------------------------
    // Accessors
    // ------------------------------------------------------------------

    const LinearOperator& linear_operator() const { return *linear_; }
    Ptr<const LinearOperator> linear_operator_ptr() const { return linear_; }

    const CoupledState& prototype() const { return prototype_; }
    const InnerProducts& inner_products() const { return inner_; }

    Index n_state() const { return prototype_.state.size(); }
    Index n_constraint() const { return prototype_.constraint.size(); }
    bool has_constraint() const { return n_constraint() > 0; }

private:
    Operators ops_;
    Ptr<const LinearOperator> linear_;
    CoupledState prototype_;
    InnerProducts inner_;

    void validate_shapes() const;
};

} // namespace ilm
