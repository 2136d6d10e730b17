/**
 * @file surface.cpp
 * @brief Immersed surface implementation
 */

#include "ilm/core/surface.hpp"
#include "ilm/core/errors.hpp"
#include <cmath>

namespace ilm {

Surface::Surface(std::vector<Vec2> points, std::vector<Vec2> normals, Vector ds)
    : points_(std::move(points))
    , normals_(std::move(normals))
    , ds_(std::move(ds))
{
    const Index n = n_points();
    if (static_cast<Index>(normals_.size()) != n || ds_.size() != n) {
        throw ConfigurationError("Surface points, normals and ds must have equal length");
    }
    if (n > 0 && ds_.minCoeff() <= 0.0) {
        throw ConfigurationError("Surface arc-length weights must be positive");
    }
}

Surface Surface::circle(Real radius, Real ds, Vec2 center) {
    if (radius <= 0.0 || ds <= 0.0) {
        throw ConfigurationError("Circle radius and spacing must be positive");
    }

    const Index n = static_cast<Index>(std::ceil(2.0 * constants::PI * radius / ds));
    const Real dtheta = 2.0 * constants::PI / static_cast<Real>(n);

    std::vector<Vec2> points(n);
    std::vector<Vec2> normals(n);
    Vector weights = Vector::Constant(n, radius * dtheta);

    for (Index k = 0; k < n; ++k) {
        const Real theta = k * dtheta;
        normals[k] = Vec2(std::cos(theta), std::sin(theta));
        points[k] = center + radius * normals[k];
    }

    return Surface(std::move(points), std::move(normals), std::move(weights));
}

SurfaceField Surface::normals_field() const {
    SurfaceField n(n_points(), 2);
    for (Index k = 0; k < n_points(); ++k) {
        n(k, 0) = normals_[k].x();
        n(k, 1) = normals_[k].y();
    }
    return n;
}

} // namespace ilm
