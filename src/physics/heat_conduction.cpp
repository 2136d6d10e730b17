/**
 * @file heat_conduction.cpp
 * @brief Dirichlet heat conduction problem
 */

#include "ilm/physics/heat_conduction.hpp"
#include "ilm/core/errors.hpp"
#include <sstream>

namespace ilm {

HeatBoundaryData HeatBoundaryData::constant(Real exterior, Real interior) {
    HeatBoundaryData bc;
    bc.exterior = [exterior](const Surface& s, Real) {
        SurfaceField f = s.zeros_surface();
        f.fill(exterior);
        return f;
    };
    bc.interior = [interior](const Surface& s, Real) {
        SurfaceField f = s.zeros_surface();
        f.fill(interior);
        return f;
    };
    return bc;
}

Real timestep_fourier(const CartesianGrid& grid, const HeatConductionParameters& params) {
    if (params.diffusivity <= 0.0 || params.fourier <= 0.0) {
        throw ConfigurationError("timestep_fourier requires positive diffusivity and Fourier number");
    }
    const Real dx = grid.cell_size();
    return params.fourier * dx * dx / params.diffusivity;
}

// ============================================================================
// DirichletHeatConduction
// ============================================================================

DirichletHeatConduction::DirichletHeatConduction(const CartesianGrid& grid,
                                                 const Surface& surface,
                                                 const HeatConductionParameters& params,
                                                 HeatBoundaryData bc,
                                                 const KrylovConfig& krylov,
                                                 const ConstraintConfig& constraint)
    : grid_(grid)
    , surface_(surface)
    , params_(params)
    , bc_(std::move(bc))
    , coupling_(CouplingOperators::bilinear(grid_, surface_))
    , tb_plus_(surface_.zeros_surface())
    , tb_minus_(surface_.zeros_surface())
    , jump_(surface_.zeros_surface())
    , sigma_neg_(surface_.zeros_surface())
    , normal_flux_(grid_.zeros_grid(2))
{
    if (!bc_.exterior || !bc_.interior) {
        throw ConfigurationError("Heat conduction requires exterior and interior surface temperatures");
    }
    if (params_.diffusivity <= 0.0) {
        throw ConfigurationError("Diffusivity must be positive");
    }

    laplacian_ = laplacian(grid_, params_.diffusivity, krylov);

    CoupledState prototype(grid_.zeros_grid(), surface_.zeros_surface());

    ConstrainedODEFunction::Operators ops;
    ops.state_rhs = [this](GridField& dT, const GridField& T, Real t) { rhs(dT, T, t); };
    ops.constraint_rhs = [this](SurfaceField& Tb, Real t) { bc_constraint_rhs(Tb, t); };
    ops.constraint_force = [this](GridField& dT, const SurfaceField& sigma) {
        op_constraint_force(dT, sigma);
    };
    ops.constraint_op = [this](SurfaceField& Tb, const GridField& T) { bc_constraint_op(Tb, T); };

    f_ = std::make_shared<ConstrainedODEFunction>(std::move(ops), laplacian_, prototype,
                                                  coupling_.inner_products(), constraint);
}

UniquePtr<DirichletHeatConduction> DirichletHeatConduction::from_config(const Config& config) {
    const ProblemConfig& p = config.problem;
    const Real L = p.half_width;

    CartesianGrid grid({-L, L}, {-L, L}, p.grid_spacing);
    Surface body = Surface::circle(p.body_radius, p.surface_spacing * grid.cell_size());

    HeatConductionParameters params;
    params.diffusivity = p.diffusivity;
    params.fourier = p.fourier;

    return std::make_unique<DirichletHeatConduction>(
        grid, body, params,
        HeatBoundaryData::constant(p.exterior_temperature, p.interior_temperature),
        config.krylov, config.constraint);
}

void DirichletHeatConduction::load_boundary(Real t) {
    SurfaceField plus = bc_.exterior(surface_, t);
    SurfaceField minus = bc_.interior(surface_, t);
    if (!plus.same_shape(tb_plus_) || !minus.same_shape(tb_minus_)) {
        std::ostringstream oss;
        oss << "Boundary temperature functions must return " << surface_.n_points()
            << " scalar surface values";
        throw ConfigurationError(oss.str());
    }
    tb_plus_.assign(plus);
    tb_minus_.assign(minus);
}

void DirichletHeatConduction::rhs(GridField& dT, const GridField& /*T*/, Real t) {
    // Double-layer term
    dT.set_zero();
    load_boundary(t);
    jump_.assign(tb_plus_);
    jump_ -= tb_minus_;
    jump_ *= -params_.diffusivity;
    coupling_.surface_divergence(jump_, dT, normal_flux_);
}

void DirichletHeatConduction::bc_constraint_rhs(SurfaceField& Tb, Real t) {
    load_boundary(t);
    Tb.assign(tb_plus_);
    Tb += tb_minus_;
    Tb *= 0.5;
}

void DirichletHeatConduction::op_constraint_force(GridField& dT, const SurfaceField& sigma) {
    sigma_neg_.assign(sigma);
    sigma_neg_ *= -1.0;
    coupling_.regularize(sigma_neg_, dT);
}

void DirichletHeatConduction::bc_constraint_op(SurfaceField& Tb, const GridField& T) {
    coupling_.interpolate(T, Tb);
}

} // namespace ilm
