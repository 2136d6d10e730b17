/**
 * @file surface.hpp
 * @brief Discretized immersed surface (closed curve in 2D)
 *
 * The surface is a list of points with outward unit normals and
 * arc-length weights. Only its size and these geometric quantities
 * are consumed by the rest of the library.
 */

#pragma once

#include "types.hpp"
#include "field.hpp"

namespace ilm {

class Surface {
public:
    Surface() = default;

    /**
     * @brief Build from explicit geometry
     *
     * @param points Point coordinates
     * @param normals Outward unit normals (one per point)
     * @param ds Arc-length weight of each point
     */
    Surface(std::vector<Vec2> points, std::vector<Vec2> normals, Vector ds);

    /**
     * @brief Circle of given radius centred at the origin
     *
     * Uses n = ceil(2 pi r / ds) uniformly spaced points, so the actual
     * spacing is slightly below the requested one.
     */
    static Surface circle(Real radius, Real ds, Vec2 center = Vec2::Zero());

    Index n_points() const { return static_cast<Index>(points_.size()); }

    const Vec2& point(Index k) const { return points_[k]; }
    const Vec2& normal(Index k) const { return normals_[k]; }
    const Vector& ds() const { return ds_; }

    /// Total arc length
    Real length() const { return ds_.sum(); }

    SurfaceField zeros_surface(Index n_components = 1) const {
        return SurfaceField(n_points(), n_components);
    }

    SurfaceField ones_surface() const {
        SurfaceField f(n_points());
        f.fill(1.0);
        return f;
    }

    /// Outward normals as a 2-component surface field
    SurfaceField normals_field() const;

private:
    std::vector<Vec2> points_;
    std::vector<Vec2> normals_;
    Vector ds_;
};

} // namespace ilm
