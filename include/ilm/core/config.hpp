/**
 * @file config.hpp
 * @brief Runtime configuration for ilm
 *
 * Defines the runtime configuration including:
 * - Time span and time marching scheme
 * - Schur complement solver options
 * - Krylov exponential options
 * - Constraint consistency checks
 * - Problem setup for the bundled heat conduction case
 * - Output settings
 */

#pragma once

#include "types.hpp"
#include <string>
#include <filesystem>
#include <iosfwd>

namespace ilm {

/**
 * @brief Time span configuration
 */
struct TimeConfig {
    Real start_time = 0.0;
    Real end_time = 1.0;
};

/**
 * @brief Integrator options
 */
struct IntegratorConfig {
    TimeMarchingScheme scheme = TimeMarchingScheme::LiskaIFHERK;
    Real dt = 0.0;                  ///< Fixed step; 0 = derive from the step-size function
    bool verbose = false;
};

/**
 * @brief Schur complement solver options
 */
struct SchurConfig {
    SchurSolveMethod method = SchurSolveMethod::Auto;
    Index dense_threshold = 1024;   ///< Auto: direct solve up to this many surface unknowns
    Index max_iterations = 500;     ///< CG iteration budget
    Real tolerance = 1e-10;         ///< CG relative residual
    Real singular_rcond = 1e-13;    ///< Relative rcond, LDLT pivot or CG curvature below which S is singular
    Real symmetry_tolerance = 1e-8; ///< Direct: relative asymmetry reported as a warning
    bool verbose = false;
};

/**
 * @brief Krylov (Lanczos) exponential action options
 */
struct KrylovConfig {
    Index subspace_dim = 30;
    Real tolerance = 1e-12;
    Index max_substeps = 256;
};

/**
 * @brief Constraint operator consistency checks
 */
struct ConstraintConfig {
#ifdef NDEBUG
    bool check_adjoint = false;
#else
    bool check_adjoint = true;
#endif
    Real adjoint_tolerance = 1e-10;
    Index adjoint_samples = 3;
    unsigned adjoint_seed = 12345;
};

/**
 * @brief Heat conduction problem setup
 */
struct ProblemConfig {
    Real diffusivity = 1.0;
    Real fourier = 0.25;            ///< Fo = kappa dt / dx^2
    Real grid_spacing = 0.01;
    Real half_width = 2.0;          ///< Domain is [-L, L] x [-L, L]
    Real body_radius = 1.0;
    Real surface_spacing = 1.4;     ///< Surface point spacing relative to the grid spacing
    Real exterior_temperature = 0.0;
    Real interior_temperature = 1.0;
};

/**
 * @brief Output configuration
 */
struct OutputConfig {
    std::filesystem::path output_dir = "./output";
    std::string output_prefix = "ilm";
    Index output_interval = 0;      ///< Write every N steps (0 = final state only)
};

/**
 * @brief Complete configuration
 */
class Config {
public:
    Config() = default;

    // Load from YAML-style file
    static Config from_file(const std::filesystem::path& filepath);

    // Save to YAML-style file
    void to_file(const std::filesystem::path& filepath) const;

    // Validate configuration (throws ConfigurationError)
    void validate() const;

    // Sub-configurations
    TimeConfig time;
    IntegratorConfig integrator;
    SchurConfig schur;
    KrylovConfig krylov;
    ConstraintConfig constraint;
    ProblemConfig problem;
    OutputConfig output;

    // Print summary
    void print_summary(std::ostream& os) const;
};

// ============================================================================
// Parser Helpers
// ============================================================================

namespace config_io {

/// Convert enum to string
std::string to_string(TimeMarchingScheme scheme);
std::string to_string(SchurSolveMethod method);
std::string to_string(IntegratorStatus status);

/// Convert string to enum
TimeMarchingScheme scheme_from_string(const std::string& s);
SchurSolveMethod schur_method_from_string(const std::string& s);

} // namespace config_io

} // namespace ilm
