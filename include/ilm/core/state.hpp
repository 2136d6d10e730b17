/**
 * @file state.hpp
 * @brief Coupled (state, constraint) solution vector
 *
 * Holds the grid state (e.g. temperature) together with the surface
 * Lagrange multipliers. Shapes are fixed when the state is created;
 * integration only overwrites values.
 */

#pragma once

#include "types.hpp"
#include "field.hpp"

namespace ilm {

struct CoupledState {
    GridField state;                ///< Grid unknowns
    SurfaceField constraint;        ///< Surface Lagrange multipliers

    CoupledState() = default;

    CoupledState(GridField state_in, SurfaceField constraint_in)
        : state(std::move(state_in))
        , constraint(std::move(constraint_in))
    {}

    /// Zero state with the same shapes as prototype
    static CoupledState zeros_like(const CoupledState& prototype) {
        return CoupledState(GridField::zeros_like(prototype.state),
                            SurfaceField::zeros_like(prototype.constraint));
    }

    bool same_shape(const CoupledState& other) const {
        return state.same_shape(other.state) && constraint.same_shape(other.constraint);
    }

    /// Overwrite values from other (shapes must match)
    void assign(const CoupledState& other);

    void set_zero() {
        state.set_zero();
        constraint.set_zero();
    }

    bool all_finite() const {
        return state.all_finite() && constraint.all_finite();
    }

    /// Pack into a flat vector [state; constraint] (for checkpointing)
    Vector pack() const;

    /// Unpack from a flat vector produced by pack()
    void unpack(const Vector& packed);
};

} // namespace ilm
