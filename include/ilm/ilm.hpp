/**
 * @file ilm.hpp
 * @brief Immersed-layer constrained ODE toolkit
 *
 * Grid PDEs with an immersed Dirichlet surface, written as a linear ODE
 * plus a Lagrange-multiplier constraint and advanced with
 * integrating-factor half-explicit Runge-Kutta schemes.
 *
 * Example usage:
 * @code
 * CartesianGrid grid({-2.0, 2.0}, {-2.0, 2.0}, 0.01);
 * Surface body = Surface::circle(1.0, 1.4 * grid.cell_size());
 *
 * DirichletHeatConduction problem(grid, body, HeatConductionParameters{},
 *                                 HeatBoundaryData::constant(0.0, 1.0));
 *
 * Integrator integrator(problem.solution_prototype(), {0.0, 1.0},
 *                       problem.ode_function(), problem.timestep());
 * integrator.advance(100 * integrator.dt());
 * @endcode
 */

#pragma once

// Core includes
#include "core/types.hpp"
#include "core/errors.hpp"
#include "core/field.hpp"
#include "core/grid.hpp"
#include "core/surface.hpp"
#include "core/state.hpp"
#include "core/config.hpp"
#include "core/output.hpp"

// Coupling includes
#include "coupling/regularization.hpp"

// Solver includes
#include "solvers/linear_operator.hpp"
#include "solvers/constrained_ode.hpp"
#include "solvers/saddle_point.hpp"
#include "solvers/integrator.hpp"

// Physics includes
#include "physics/heat_conduction.hpp"
