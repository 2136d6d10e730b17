/**
 * @file types.hpp
 * @brief Core type definitions for ilm
 *
 * This file defines the fundamental types used throughout ilm,
 * including scalar types, Eigen array types, configuration enums
 * and the result structures returned by solvers and integrators.
 */

#pragma once

#include <Eigen/Core>
#include <Eigen/Sparse>
#include <cstdint>
#include <memory>
#include <vector>
#include <array>
#include <functional>
#include <string>

namespace ilm {

// ============================================================================
// Scalar Types
// ============================================================================

using Real = double;
using Index = int64_t;

// ============================================================================
// Array Types (Eigen-based)
// ============================================================================

// Dense vectors
using Vector = Eigen::VectorXd;

// Dense matrices
using Matrix = Eigen::MatrixXd;

// Sparse matrices (CSR format for fast mat-vec)
using SparseMatrix = Eigen::SparseMatrix<Real, Eigen::RowMajor>;
using SparseTriplet = Eigen::Triplet<Real>;

// Fixed-size vectors for coordinates
using Vec2 = Eigen::Vector2d;

// ============================================================================
// Decision Enums
// ============================================================================

/**
 * @brief Time marching algorithm for constrained ODE systems
 */
enum class TimeMarchingScheme {
    IFHEEuler,          ///< First-order integrating-factor half-explicit Euler
    LiskaIFHERK,        ///< Second-order 3-stage integrating-factor HERK (Liska & Colonius)
};

/**
 * @brief Strategy for the Schur complement solve
 */
enum class SchurSolveMethod {
    Auto,               ///< Direct below the dense threshold, CG above
    Direct,             ///< Assembled dense Schur complement, LDLT factorization
    ConjugateGradient,  ///< Matrix-free Eigen ConjugateGradient
};

/**
 * @brief Integrator life cycle
 */
enum class IntegratorStatus {
    Uninitialized,
    Ready,
    Stepping,
    Finished,
    Failed,
};

// ============================================================================
// Forward Declarations
// ============================================================================

class CartesianGrid;
class Surface;
class CouplingOperators;

struct CoupledState;
class Config;

class LinearOperator;
class ExpPropagator;
class ConstrainedODEFunction;
class SaddlePointSolver;
class Integrator;

class DirichletHeatConduction;

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

template<typename T>
using Ptr = std::shared_ptr<T>;

template<typename T>
using UniquePtr = std::unique_ptr<T>;

// ============================================================================
// Result Types
// ============================================================================

/**
 * @brief Result of a Schur complement solve
 *
 * solve_time_ms covers the whole solve, including the exponential actions.
 */
struct SolveResult {
    bool converged = false;
    Index iterations = 0;
    Real final_residual = 0.0;
    Real solve_time_ms = 0.0;
    std::string message;
};

/**
 * @brief Result of an integrator advance call
 */
struct StepResult {
    bool success = false;
    Index steps_taken = 0;
    Real time = 0.0;
    Index schur_iterations = 0;     ///< Total CG iterations (0 for direct solves)
    Real last_residual = 0.0;       ///< Residual of the last Schur solve
    std::string message;
};

// ============================================================================
// Constants
// ============================================================================

namespace constants {
    constexpr Real EPSILON = 1e-15;             ///< Numerical zero
    constexpr Real PI = 3.14159265358979323846;
}

} // namespace ilm
