/**
 * @file config.cpp
 * @brief Configuration parsing and validation
 */

#include "ilm/core/config.hpp"
#include "ilm/core/errors.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <iomanip>
#include <limits>

namespace ilm {

namespace {

bool parse_bool(const std::string& value) {
    if (value == "true" || value == "on" || value == "1") return true;
    if (value == "false" || value == "off" || value == "0") return false;
    throw ConfigurationError("Expected a boolean, got: " + value);
}

Real parse_real(const std::string& key, const std::string& value) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw ConfigurationError("Invalid number for " + key + ": " + value);
    }
}

Index parse_index(const std::string& key, const std::string& value) {
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        throw ConfigurationError("Invalid integer for " + key + ": " + value);
    }
}

} // namespace

// ============================================================================
// Config
// ============================================================================

Config Config::from_file(const std::filesystem::path& filepath) {
    Config config;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot open config file: " + filepath.string());
    }

    // Simple key-value parser (no YAML library dependency)
    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        // Strip comments
        auto comment_pos = line.find('#');
        if (comment_pos != std::string::npos) {
            line = line.substr(0, comment_pos);
        }

        // Trim whitespace
        auto start = line.find_first_not_of(" \t");
        if (start == std::string::npos) continue;
        line = line.substr(start);

        auto colon_pos = line.find(':');
        if (colon_pos == std::string::npos) continue;

        std::string key = line.substr(0, colon_pos);
        std::string value = line.substr(colon_pos + 1);

        // Trim key
        auto key_end = key.find_last_not_of(" \t");
        if (key_end != std::string::npos) {
            key = key.substr(0, key_end + 1);
        }

        // Section headers (lines ending with ':' and no value)
        auto val_start = value.find_first_not_of(" \t\r\n");
        if (val_start == std::string::npos) {
            current_section = key;
            continue;
        }
        value = value.substr(val_start);
        auto val_end = value.find_last_not_of(" \t\r\n");
        if (val_end != std::string::npos) {
            value = value.substr(0, val_end + 1);
        }

        if (current_section == "time") {
            if (key == "start_time")
                config.time.start_time = parse_real(key, value);
            else if (key == "end_time")
                config.time.end_time = parse_real(key, value);
        } else if (current_section == "integrator") {
            if (key == "scheme")
                config.integrator.scheme = config_io::scheme_from_string(value);
            else if (key == "dt")
                config.integrator.dt = parse_real(key, value);
            else if (key == "verbose")
                config.integrator.verbose = parse_bool(value);
        } else if (current_section == "schur") {
            if (key == "method")
                config.schur.method = config_io::schur_method_from_string(value);
            else if (key == "dense_threshold")
                config.schur.dense_threshold = parse_index(key, value);
            else if (key == "max_iterations")
                config.schur.max_iterations = parse_index(key, value);
            else if (key == "tolerance")
                config.schur.tolerance = parse_real(key, value);
            else if (key == "singular_rcond")
                config.schur.singular_rcond = parse_real(key, value);
            else if (key == "symmetry_tolerance")
                config.schur.symmetry_tolerance = parse_real(key, value);
            else if (key == "verbose")
                config.schur.verbose = parse_bool(value);
        } else if (current_section == "krylov") {
            if (key == "subspace_dim")
                config.krylov.subspace_dim = parse_index(key, value);
            else if (key == "tolerance")
                config.krylov.tolerance = parse_real(key, value);
            else if (key == "max_substeps")
                config.krylov.max_substeps = parse_index(key, value);
        } else if (current_section == "constraint") {
            if (key == "check_adjoint")
                config.constraint.check_adjoint = parse_bool(value);
            else if (key == "adjoint_tolerance")
                config.constraint.adjoint_tolerance = parse_real(key, value);
            else if (key == "adjoint_samples")
                config.constraint.adjoint_samples = parse_index(key, value);
            else if (key == "adjoint_seed")
                config.constraint.adjoint_seed = static_cast<unsigned>(parse_index(key, value));
        } else if (current_section == "problem") {
            if (key == "diffusivity")
                config.problem.diffusivity = parse_real(key, value);
            else if (key == "fourier")
                config.problem.fourier = parse_real(key, value);
            else if (key == "grid_spacing")
                config.problem.grid_spacing = parse_real(key, value);
            else if (key == "half_width")
                config.problem.half_width = parse_real(key, value);
            else if (key == "body_radius")
                config.problem.body_radius = parse_real(key, value);
            else if (key == "surface_spacing")
                config.problem.surface_spacing = parse_real(key, value);
            else if (key == "exterior_temperature")
                config.problem.exterior_temperature = parse_real(key, value);
            else if (key == "interior_temperature")
                config.problem.interior_temperature = parse_real(key, value);
        } else if (current_section == "output") {
            if (key == "output_dir")
                config.output.output_dir = value;
            else if (key == "output_prefix")
                config.output.output_prefix = value;
            else if (key == "output_interval")
                config.output.output_interval = parse_index(key, value);
        }
    }

    config.validate();
    return config;
}

void Config::to_file(const std::filesystem::path& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot write config file: " + filepath.string());
    }

    file << std::setprecision(std::numeric_limits<Real>::max_digits10);
    file << std::boolalpha;

    file << "# ilm configuration file\n\n";

    file << "time:\n";
    file << "  start_time: " << time.start_time << "\n";
    file << "  end_time: " << time.end_time << "\n\n";

    file << "integrator:\n";
    file << "  scheme: " << config_io::to_string(integrator.scheme) << "\n";
    file << "  dt: " << integrator.dt << "\n";
    file << "  verbose: " << integrator.verbose << "\n\n";

    file << "schur:\n";
    file << "  method: " << config_io::to_string(schur.method) << "\n";
    file << "  dense_threshold: " << schur.dense_threshold << "\n";
    file << "  max_iterations: " << schur.max_iterations << "\n";
    file << "  tolerance: " << schur.tolerance << "\n";
    file << "  singular_rcond: " << schur.singular_rcond << "\n";
    file << "  symmetry_tolerance: " << schur.symmetry_tolerance << "\n";
    file << "  verbose: " << schur.verbose << "\n\n";

    file << "krylov:\n";
    file << "  subspace_dim: " << krylov.subspace_dim << "\n";
    file << "  tolerance: " << krylov.tolerance << "\n";
    file << "  max_substeps: " << krylov.max_substeps << "\n\n";

    file << "constraint:\n";
    file << "  check_adjoint: " << constraint.check_adjoint << "\n";
    file << "  adjoint_tolerance: " << constraint.adjoint_tolerance << "\n";
    file << "  adjoint_samples: " << constraint.adjoint_samples << "\n";
    file << "  adjoint_seed: " << constraint.adjoint_seed << "\n\n";

    file << "problem:\n";
    file << "  diffusivity: " << problem.diffusivity << "\n";
    file << "  fourier: " << problem.fourier << "\n";
    file << "  grid_spacing: " << problem.grid_spacing << "\n";
    file << "  half_width: " << problem.half_width << "\n";
    file << "  body_radius: " << problem.body_radius << "\n";
    file << "  surface_spacing: " << problem.surface_spacing << "\n";
    file << "  exterior_temperature: " << problem.exterior_temperature << "\n";
    file << "  interior_temperature: " << problem.interior_temperature << "\n\n";

    file << "output:\n";
    file << "  output_dir: " << output.output_dir.string() << "\n";
    file << "  output_prefix: " << output.output_prefix << "\n";
    file << "  output_interval: " << output.output_interval << "\n";
}

void Config::validate() const {
    if (time.end_time <= time.start_time) {
        throw ConfigurationError("end_time must be greater than start_time");
    }
    if (integrator.dt < 0.0) {
        throw ConfigurationError("dt must be non-negative (0 derives it from the problem)");
    }
    if (schur.max_iterations < 1) {
        throw ConfigurationError("schur.max_iterations must be >= 1");
    }
    if (schur.tolerance <= 0.0) {
        throw ConfigurationError("schur.tolerance must be positive");
    }
    if (schur.dense_threshold < 0) {
        throw ConfigurationError("schur.dense_threshold must be non-negative");
    }
    if (krylov.subspace_dim < 2) {
        throw ConfigurationError("krylov.subspace_dim must be >= 2");
    }
    if (krylov.max_substeps < 1) {
        throw ConfigurationError("krylov.max_substeps must be >= 1");
    }
    if (constraint.adjoint_samples < 1) {
        throw ConfigurationError("constraint.adjoint_samples must be >= 1");
    }
    if (problem.diffusivity <= 0.0 || problem.fourier <= 0.0) {
        throw ConfigurationError("diffusivity and fourier must be positive");
    }
    if (problem.grid_spacing <= 0.0 || problem.half_width <= 0.0 ||
        problem.body_radius <= 0.0 || problem.surface_spacing <= 0.0) {
        throw ConfigurationError("problem geometry must be positive");
    }
    if (problem.body_radius >= problem.half_width) {
        throw ConfigurationError("body must fit inside the domain");
    }
}

void Config::print_summary(std::ostream& os) const {
    os << "=== ilm Configuration ===\n";
    os << "Time:\n";
    os << "  Span:      [" << time.start_time << ", " << time.end_time << "]\n";
    os << "Integrator:\n";
    os << "  Scheme:    " << config_io::to_string(integrator.scheme) << "\n";
    if (integrator.dt > 0.0) {
        os << "  dt:        " << integrator.dt << "\n";
    } else {
        os << "  dt:        Fourier (Fo = " << problem.fourier << ")\n";
    }
    os << "Schur solver:\n";
    os << "  Method:    " << config_io::to_string(schur.method)
       << " (dense up to " << schur.dense_threshold << ")\n";
    os << "  CG:        tol=" << schur.tolerance << ", max_iter=" << schur.max_iterations << "\n";
    os << "Problem:\n";
    os << "  kappa:     " << problem.diffusivity << "\n";
    os << "  dx:        " << problem.grid_spacing << "\n";
    os << "  radius:    " << problem.body_radius << "\n";
    os << "========================\n";
}

// ============================================================================
// config_io helpers
// ============================================================================

namespace config_io {

std::string to_string(TimeMarchingScheme scheme) {
    switch (scheme) {
        case TimeMarchingScheme::IFHEEuler: return "IFHEEuler";
        case TimeMarchingScheme::LiskaIFHERK: return "LiskaIFHERK";
        default: return "Unknown";
    }
}

std::string to_string(SchurSolveMethod method) {
    switch (method) {
        case SchurSolveMethod::Auto: return "Auto";
        case SchurSolveMethod::Direct: return "Direct";
        case SchurSolveMethod::ConjugateGradient: return "ConjugateGradient";
        default: return "Unknown";
    }
}

std::string to_string(IntegratorStatus status) {
    switch (status) {
        case IntegratorStatus::Uninitialized: return "Uninitialized";
        case IntegratorStatus::Ready: return "Ready";
        case IntegratorStatus::Stepping: return "Stepping";
        case IntegratorStatus::Finished: return "Finished";
        case IntegratorStatus::Failed: return "Failed";
        default: return "Unknown";
    }
}

TimeMarchingScheme scheme_from_string(const std::string& s) {
    if (s == "IFHEEuler") return TimeMarchingScheme::IFHEEuler;
    if (s == "LiskaIFHERK") return TimeMarchingScheme::LiskaIFHERK;
    throw ConfigurationError("Unknown time marching scheme: " + s);
}

SchurSolveMethod schur_method_from_string(const std::string& s) {
    if (s == "Auto") return SchurSolveMethod::Auto;
    if (s == "Direct") return SchurSolveMethod::Direct;
    if (s == "ConjugateGradient") return SchurSolveMethod::ConjugateGradient;
    throw ConfigurationError("Unknown Schur solve method: " + s);
}

} // namespace config_io

} // namespace ilm
