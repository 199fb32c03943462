#pragma once

/** \file distance.hpp
 *  \brief Scalar reference kernel for squared L2 distance with double accumulation.
 *
 * Preconditions
 * - a.size() == b.size() (checked by callers, see distance_engine.hpp)
 * Determinism: pure function, no allocations, no exceptions on hot paths.
 * Elements are widened to double before subtraction, so the sum does not lose
 * precision over high dimensions. No square root is taken.
 */

#include <cstddef>
#include <span>

namespace sqvec::kernels {

/** \brief Sum of squared differences: sum((a[i] - b[i])^2) in double. O(d). */
inline double l2_sq_f64(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  // 4-way unrolled loop for better instruction-level parallelism
  double s0 = 0.0, s1 = 0.0, s2 = 0.0, s3 = 0.0;
  std::size_t i = 0;

  const std::size_t unroll_end = n & ~std::size_t{3};
  for (; i < unroll_end; i += 4) {
    const double d0 = static_cast<double>(pa[i])   - static_cast<double>(pb[i]);
    const double d1 = static_cast<double>(pa[i+1]) - static_cast<double>(pb[i+1]);
    const double d2 = static_cast<double>(pa[i+2]) - static_cast<double>(pb[i+2]);
    const double d3 = static_cast<double>(pa[i+3]) - static_cast<double>(pb[i+3]);

    s0 += d0 * d0;
    s1 += d1 * d1;
    s2 += d2 * d2;
    s3 += d3 * d3;
  }

  double s = (s0 + s1) + (s2 + s3);

  // Handle remaining elements
  for (; i < n; ++i) {
    const double d = static_cast<double>(pa[i]) - static_cast<double>(pb[i]);
    s += d * d;
  }
  return s;
}

} // namespace sqvec::kernels
