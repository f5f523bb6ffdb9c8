/**
 * Fixed-Point Vector Operations
 *
 * All embedding values are signed integers scaled by 1000. Products are
 * rescaled term by term (sum(a_i * b_i / 1000)), never once at the end,
 * so truncation matches bit for bit across replicas.
 */

#pragma once

#include "polarity/types.hpp"

namespace polarity {
namespace fixed {

// sum over i of (a_i * b_i) / SCALE, truncating each term toward zero
template<typename DerivedA, typename DerivedB>
inline int64_t scaled_dot(const Eigen::MatrixBase<DerivedA>& a,
                          const Eigen::MatrixBase<DerivedB>& b) {
    return ((a.template cast<int64_t>().array() * b.template cast<int64_t>().array())
            / constants::SCALE).sum();
}

// Integer mean of an accumulator; zero divisor leaves the accumulator as is
template<typename Derived>
inline void divide_guarded(Eigen::MatrixBase<Derived>& accum, int64_t divisor) {
    if (divisor == 0) return;
    accum.derived() = accum.derived() / divisor;
}

inline int sign(int64_t v) noexcept {
    return (v > 0) - (v < 0);
}

} // namespace fixed
} // namespace polarity
