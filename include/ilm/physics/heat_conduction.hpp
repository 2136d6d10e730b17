/**
 * @file heat_conduction.hpp
 * @brief Unsteady heat conduction with an immersed Dirichlet surface
 *
 * Solves
 *
 *   dT/dt = kappa nabla^2(T) + sigma delta(chi) - div(kappa [T] n delta(chi))
 *
 * subject to T = (T_b^+ + T_b^-) / 2 on the surface, where [T] = T_b^+ - T_b^-
 * is the prescribed jump across it. In the constrained-ODE form:
 *
 * - state_rhs:        double-layer source  D_s(-kappa [T])
 * - constraint_rhs:   (T_b^+ + T_b^-) / 2
 * - constraint_force: -R sigma
 * - constraint_op:    E T
 * - linear operator:  kappa L  (exponentiated by the integrator)
 */

#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../core/field.hpp"
#include "../core/grid.hpp"
#include "../core/surface.hpp"
#include "../core/state.hpp"
#include "../coupling/regularization.hpp"
#include "../solvers/constrained_ode.hpp"
#include "../solvers/linear_operator.hpp"

namespace ilm {

/**
 * @brief Physical parameters
 */
struct HeatConductionParameters {
    Real diffusivity = 1.0;         ///< kappa
    Real fourier = 0.25;            ///< Fo = kappa dt / dx^2
};

/// Surface data as a function of (surface, time)
using SurfaceDataFunction = std::function<SurfaceField(const Surface&, Real)>;

/**
 * @brief Prescribed surface temperatures on either side of the surface
 */
struct HeatBoundaryData {
    SurfaceDataFunction exterior;   ///< T_b^+ (side the normals point into)
    SurfaceDataFunction interior;   ///< T_b^-

    /// Time-independent uniform values
    static HeatBoundaryData constant(Real exterior, Real interior);
};

/**
 * @brief Stable step from the Fourier number: dt = Fo dx^2 / kappa
 */
Real timestep_fourier(const CartesianGrid& grid, const HeatConductionParameters& params);

/**
 * @brief Heat conduction problem: owns geometry, operators and scratch
 *
 * The callbacks of the ConstrainedODEFunction refer back to this object,
 * so it is neither copyable nor movable and must outlive every integrator
 * built from ode_function().
 */
class DirichletHeatConduction {
public:
    DirichletHeatConduction(const CartesianGrid& grid,
                            const Surface& surface,
                            const HeatConductionParameters& params,
                            HeatBoundaryData bc,
                            const KrylovConfig& krylov = {},
                            const ConstraintConfig& constraint = {});

    /// Build from the problem section of a Config
    static UniquePtr<DirichletHeatConduction> from_config(const Config& config);

    DirichletHeatConduction(const DirichletHeatConduction&) = delete;
    DirichletHeatConduction& operator=(const DirichletHeatConduction&) = delete;

    Ptr<const ConstrainedODEFunction> ode_function() const { return f_; }

    /// Zero (temperature, multiplier) pair
    CoupledState solution_prototype() const { return CoupledState::zeros_like(f_->prototype()); }

    /// timestep_fourier(grid(), parameters())
    Real timestep() const { return timestep_fourier(grid_, params_); }

    const CartesianGrid& grid() const { return grid_; }
    const Surface& surface() const { return surface_; }
    const CouplingOperators& coupling() const { return coupling_; }
    const HeatConductionParameters& parameters() const { return params_; }
    const SparseLinearOperator& laplacian_operator() const { return *laplacian_; }

private:
    CartesianGrid grid_;
    Surface surface_;
    HeatConductionParameters params_;
    HeatBoundaryData bc_;
    CouplingOperators coupling_;
    Ptr<SparseLinearOperator> laplacian_;
    Ptr<ConstrainedODEFunction> f_;

    // Scratch
    SurfaceField tb_plus_;
    SurfaceField tb_minus_;
    SurfaceField jump_;
    SurfaceField sigma_neg_;
    GridField normal_flux_;

    void load_boundary(Real t);

    void rhs(GridField& dT, const GridField& T, Real t);
    void bc_constraint_rhs(SurfaceField& Tb, Real t);
    void op_constraint_force(GridField& dT, const SurfaceField& sigma);
    void bc_constraint_op(SurfaceField& Tb, const GridField& T);
};

} // namespace ilm
