/**
 * @file state.cpp
 * @brief Coupled state implementation
 */

#include "ilm/core/state.hpp"
#include "ilm/core/errors.hpp"

namespace ilm {

void CoupledState::assign(const CoupledState& other) {
    if (!same_shape(other)) {
        throw ConfigurationError("CoupledState shape mismatch in assign");
    }
    state.assign(other.state);
    constraint.assign(other.constraint);
}

Vector CoupledState::pack() const {
    Vector packed(state.size() + constraint.size());
    packed.head(state.size()) = state.values();
    packed.tail(constraint.size()) = constraint.values();
    return packed;
}

void CoupledState::unpack(const Vector& packed) {
    if (packed.size() != state.size() + constraint.size()) {
        throw std::invalid_argument("packed state size mismatch");
    }
    state.values() = packed.head(state.size());
    constraint.values() = packed.tail(constraint.size());
}

} // namespace ilm
