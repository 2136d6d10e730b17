/**
 * @file grid.cpp
 * @brief Cartesian grid implementation
 */

#include "ilm/core/grid.hpp"
#include "ilm/core/errors.hpp"
#include <cmath>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace ilm {

CartesianGrid::CartesianGrid(std::pair<Real, Real> xlim, std::pair<Real, Real> ylim, Real dx)
    : xmin_(xlim.first)
    , ymin_(ylim.first)
    , dx_(dx)
{
    if (dx <= 0.0) {
        throw ConfigurationError("Grid spacing must be positive");
    }
    if (xlim.second <= xlim.first || ylim.second <= ylim.first) {
        throw ConfigurationError("Grid limits must be increasing");
    }

    nx_ = static_cast<Index>(std::llround((xlim.second - xlim.first) / dx));
    ny_ = static_cast<Index>(std::llround((ylim.second - ylim.first) / dx));

    if (nx_ < 3 || ny_ < 3) {
        throw ConfigurationError("Grid needs at least 3 cells per direction");
    }
}

GridField CartesianGrid::evaluate(const std::function<Real(Real, Real)>& f) const {
    GridField out = zeros_grid();
    #pragma omp parallel for
    for (Index j = 0; j < ny_; ++j) {
        for (Index i = 0; i < nx_; ++i) {
            out(index(i, j)) = f(x(i), y(j));
        }
    }
    return out;
}

} // namespace ilm
