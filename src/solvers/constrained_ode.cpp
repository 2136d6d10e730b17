/**
 * @file constrained_ode.cpp
 * @brief Constrained ODE function implementation
 */

#include "ilm/solvers/constrained_ode.hpp"
#include "ilm/core/errors.hpp"
#include <algorithm>
#include <random>
#include <sstream>
#include <cmath>

namespace ilm {

namespace {

template<typename F>
void check_output(const F& out, const F& prototype, const char* name) {
    if (!out.same_shape(prototype)) {
        std::ostringstream oss;
        oss << name << " produced a field of shape " << out.n_points() << "x" << out.n_components()
            << ", expected " << prototype.n_points() << "x" << prototype.n_components();
        throw ConfigurationError(oss.str());
    }
    if (!out.all_finite()) {
        throw NumericalDivergence(std::string(name) + " produced non-finite values");
    }
}

template<typename F>
void fill_random(F& f, std::mt19937& gen) {
    std::uniform_real_distribution<Real> dist(-1.0, 1.0);
    for (Index i = 0; i < f.size(); ++i) {
        f(i) = dist(gen);
    }
}

} // namespace

ConstrainedODEFunction::ConstrainedODEFunction(Operators operators,
                                               Ptr<const LinearOperator> linear,
                                               const CoupledState& prototype,
                                               InnerProducts inner,
                                               const ConstraintConfig& config)
    : ops_(std::move(operators))
    , linear_(std::move(linear))
    , prototype_(CoupledState::zeros_like(prototype))
    , inner_(std::move(inner))
{
    if (!ops_.state_rhs || !ops_.constraint_rhs || !ops_.constraint_force || !ops_.constraint_op) {
        throw ConfigurationError("ConstrainedODEFunction requires all four operator callbacks");
    }
    if (!linear_) {
        throw ConfigurationError("ConstrainedODEFunction requires a linear operator");
    }
    if (linear_->size() != n_state()) {
        std::ostringstream oss;
        oss << "Linear operator size " << linear_->size()
            << " does not match state size " << n_state();
        throw ConfigurationError(oss.str());
    }
    if (inner_.surface_weights.size() != 0 &&
        inner_.surface_weights.size() != prototype_.constraint.n_points()) {
        throw ConfigurationError("Surface weights must have one entry per surface point");
    }

    validate_shapes();

    if (config.check_adjoint && has_constraint()) {
        const Real mismatch = check_adjoint(config.adjoint_samples, config.adjoint_seed);
        if (mismatch > config.adjoint_tolerance) {
            std::ostringstream oss;
            oss << "constraint_op is not the adjoint of -constraint_force (relative mismatch "
                << mismatch << " > " << config.adjoint_tolerance << ")";
            throw ConfigurationError(oss.str());
        }
    }
}

void ConstrainedODEFunction::validate_shapes() const {
    GridField g = GridField::zeros_like(prototype_.state);
    SurfaceField s = SurfaceField::zeros_like(prototype_.constraint);

    // Only shapes are checked here; values are validated when stepping
    ops_.state_rhs(g, prototype_.state, 0.0);
    if (!g.same_shape(prototype_.state)) {
        throw ConfigurationError("state_rhs output does not match the state prototype");
    }
    ops_.constraint_rhs(s, 0.0);
    if (!s.same_shape(prototype_.constraint)) {
        throw ConfigurationError("constraint_rhs output does not match the constraint prototype");
    }
    ops_.constraint_force(g, prototype_.constraint);
    if (!g.same_shape(prototype_.state)) {
        throw ConfigurationError("constraint_force output does not match the state prototype");
    }
    ops_.constraint_op(s, prototype_.state);
    if (!s.same_shape(prototype_.constraint)) {
        throw ConfigurationError("constraint_op output does not match the constraint prototype");
    }
}

void ConstrainedODEFunction::state_rhs(GridField& out, const GridField& u, Real t) const {
    ops_.state_rhs(out, u, t);
    check_output(out, prototype_.state, "state_rhs");
}

void ConstrainedODEFunction::constraint_rhs(SurfaceField& out, Real t) const {
    ops_.constraint_rhs(out, t);
    check_output(out, prototype_.constraint, "constraint_rhs");
}

void ConstrainedODEFunction::constraint_force(GridField& out, const SurfaceField& sigma) const {
    ops_.constraint_force(out, sigma);
    check_output(out, prototype_.state, "constraint_force");
}

void ConstrainedODEFunction::constraint_op(SurfaceField& out, const GridField& u) const {
    ops_.constraint_op(out, u);
    check_output(out, prototype_.constraint, "constraint_op");
}

Real ConstrainedODEFunction::check_adjoint(Index samples, unsigned seed) const {
    if (!has_constraint()) {
        return 0.0;
    }

    std::mt19937 gen(seed);
    GridField x = GridField::zeros_like(prototype_.state);
    GridField fs = GridField::zeros_like(prototype_.state);
    SurfaceField s = SurfaceField::zeros_like(prototype_.constraint);
    SurfaceField ox = SurfaceField::zeros_like(prototype_.constraint);

    Real worst = 0.0;
    for (Index k = 0; k < samples; ++k) {
        fill_random(x, gen);
        fill_random(s, gen);

        constraint_op(ox, x);
        constraint_force(fs, s);

        const Real lhs = inner_.surface(ox, s);
        const Real rhs = inner_.grid(x, fs);
        const Real scale = std::sqrt(inner_.surface(ox, ox) * inner_.surface(s, s)) +
                           std::sqrt(inner_.grid(x, x) * inner_.grid(fs, fs));

        const Real mismatch = std::abs(lhs + rhs) / (scale + constants::EPSILON);
        worst = std::max(worst, mismatch);
    }
    return worst;
}

} // namespace ilm
