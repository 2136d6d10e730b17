/**
 * @file grid.hpp
 * @brief Uniform cell-centred Cartesian grid
 *
 * Samples live at cell centres x_i = xmin + (i + 1/2) dx, stored
 * row by row (index = j * nx + i). Values outside the grid are
 * treated as zero by the differential operators built on it.
 */

#pragma once

#include "types.hpp"
#include "field.hpp"
#include <utility>

namespace ilm {

class CartesianGrid {
public:
    CartesianGrid() = default;

    /**
     * @brief Build a grid covering xlim x ylim with spacing dx
     *
     * The number of cells is rounded so that the spacing is exactly dx;
     * the upper limits are adjusted accordingly.
     */
    CartesianGrid(std::pair<Real, Real> xlim, std::pair<Real, Real> ylim, Real dx);

    Index nx() const { return nx_; }
    Index ny() const { return ny_; }
    Index n_points() const { return nx_ * ny_; }

    Real cell_size() const { return dx_; }
    Real cell_area() const { return dx_ * dx_; }

    Real xmin() const { return xmin_; }
    Real ymin() const { return ymin_; }
    Real xmax() const { return xmin_ + nx_ * dx_; }
    Real ymax() const { return ymin_ + ny_ * dx_; }

    Index index(Index i, Index j) const { return j * nx_ + i; }

    Real x(Index i) const { return xmin_ + (static_cast<Real>(i) + 0.5) * dx_; }
    Real y(Index j) const { return ymin_ + (static_cast<Real>(j) + 0.5) * dx_; }
    Vec2 point(Index i, Index j) const { return Vec2(x(i), y(j)); }

    /// Zero-initialized grid data
    GridField zeros_grid(Index n_components = 1) const {
        return GridField(n_points(), n_components);
    }

    /// Sample a scalar function at every cell centre
    GridField evaluate(const std::function<Real(Real, Real)>& f) const;

private:
    Real xmin_ = 0.0;
    Real ymin_ = 0.0;
    Real dx_ = 1.0;
    Index nx_ = 0;
    Index ny_ = 0;
};

} // namespace ilm
