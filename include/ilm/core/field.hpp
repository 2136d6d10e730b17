/**
 * @file field.hpp
 * @brief Typed sample containers for grid and surface data
 *
 * Grid and surface data share one flat Eigen storage layout
 * (point-major, components interleaved) but are distinct C++ types,
 * so a surface field can never be handed to an operator expecting
 * grid data.
 */

#pragma once

#include "types.hpp"
#include <stdexcept>

namespace ilm {

struct GridTag {};
struct SurfaceTag {};

/**
 * @brief Samples of a scalar or vector quantity at n_points locations
 */
template<typename Tag>
class Field {
public:
    Field() = default;

    explicit Field(Index n_points, Index n_components = 1)
        : data_(Vector::Zero(n_points * n_components))
        , n_components_(n_components)
    {}

    Field(Vector data, Index n_components)
        : data_(std::move(data))
        , n_components_(n_components)
    {
        if (n_components_ <= 0 || data_.size() % n_components_ != 0) {
            throw std::invalid_argument("Field data size is not a multiple of the component count");
        }
    }

    /// Zero field with the same shape as other
    static Field zeros_like(const Field& other) {
        return Field(other.n_points(), other.n_components());
    }

    // Shape
    Index size() const { return data_.size(); }
    Index n_points() const { return n_components_ > 0 ? data_.size() / n_components_ : 0; }
    Index n_components() const { return n_components_; }
    bool empty() const { return data_.size() == 0; }

    bool same_shape(const Field& other) const {
        return size() == other.size() && n_components_ == other.n_components_;
    }

    // Raw access
    Vector& values() { return data_; }
    const Vector& values() const { return data_; }

    Real& operator()(Index i) { return data_(i); }
    Real operator()(Index i) const { return data_(i); }

    Real& operator()(Index point, Index component) {
        return data_(point * n_components_ + component);
    }
    Real operator()(Index point, Index component) const {
        return data_(point * n_components_ + component);
    }

    // Algebra (shapes must match; checked by the callers that own the buffers)
    void set_zero() { data_.setZero(); }
    void fill(Real value) { data_.setConstant(value); }

    Field& operator+=(const Field& other) { data_ += other.data_; return *this; }
    Field& operator-=(const Field& other) { data_ -= other.data_; return *this; }
    Field& operator*=(Real a) { data_ *= a; return *this; }

    /// this += a * x
    void axpy(Real a, const Field& x) { data_.noalias() += a * x.data_; }

    /// Unweighted Euclidean dot product
    Real dot(const Field& other) const { return data_.dot(other.data_); }

    Real norm() const { return data_.norm(); }
    Real max_abs() const { return data_.size() > 0 ? data_.cwiseAbs().maxCoeff() : 0.0; }

    bool all_finite() const { return data_.allFinite(); }

    /// Copy values without reallocating (shapes must already match)
    void assign(const Field& other) { data_ = other.data_; }

private:
    Vector data_;
    Index n_components_ = 1;
};

using GridField = Field<GridTag>;
using SurfaceField = Field<SurfaceTag>;

/**
 * @brief Weights defining the grid and surface inner products
 *
 *   <u, v>_grid    = grid_weight * sum_i u_i v_i
 *   <p, q>_surface = sum_k w_k p_k q_k   (w_k = 1 when surface_weights is empty)
 *
 * For vector-valued surface data each component of point k uses w_k.
 */
struct InnerProducts {
    Real grid_weight = 1.0;
    Vector surface_weights;

    Real grid(const GridField& u, const GridField& v) const {
        return grid_weight * u.dot(v);
    }

    Real surface(const SurfaceField& p, const SurfaceField& q) const {
        if (surface_weights.size() == 0) {
            return p.dot(q);
        }
        const Index nc = p.n_components();
        Real sum = 0.0;
        for (Index k = 0; k < p.n_points(); ++k) {
            for (Index c = 0; c < nc; ++c) {
                sum += surface_weights(k) * p(k, c) * q(k, c);
            }
        }
        return sum;
    }
};

} // namespace ilm
