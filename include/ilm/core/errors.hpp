/**
 * @file errors.hpp
 * @brief Exception taxonomy for ilm
 *
 * Fatal conditions are thrown. A Schur solve that runs out of iterations
 * is not fatal and is reported through SolveResult / StepResult instead.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace ilm {

/**
 * @brief Base class of all ilm errors
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Inconsistent setup: shape mismatch, invalid configuration
 *
 * Raised at construction time; no partially built object survives.
 */
class ConfigurationError : public Error {
public:
    using Error::Error;
};

/**
 * @brief A callback or exponential action produced NaN/Inf
 */
class NumericalDivergence : public Error {
public:
    using Error::Error;
};

/**
 * @brief The Schur complement could not be inverted
 */
class SingularSystem : public Error {
public:
    using Error::Error;
};

} // namespace ilm
