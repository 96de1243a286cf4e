/**
 * @file Reductions.hpp
 * @brief Declarations of the axis reductions.
 *
 * Every reduction takes a list of axes (negative values count from the
 * end, duplicates are ignored, an empty list selects every axis) and keeps
 * the rank: reduced extents become 1. Work runs on the calling thread's
 * current queue.
 *
 * Reductions without a neutral seed (min, max, absmax, all, any) start
 * from the first element along the reduced axes and therefore require
 * those axes to be non-empty.
 */

#ifndef STRATUM_REDUCTIONS_HPP
#define STRATUM_REDUCTIONS_HPP

#include <cstdint>
#include <vector>

#include "Tensor.hpp"

namespace stratum
{

/**
 * @brief Sum of elements along @p axes.
 * @throws bounds_error if an axis is out of range.
 */
template <typename value_t>
Tensor<value_t> sum(const Tensor<value_t>& x,
                    const std::vector<int64_t>& axes = {});

/**
 * @brief Arithmetic mean along @p axes.
 *
 * Divides the sum by the number of reduced elements.
 */
template <typename value_t>
Tensor<value_t> mean(const Tensor<value_t>& x,
                     const std::vector<int64_t>& axes = {});

/**
 * @brief Product of elements along @p axes.
 */
template <typename value_t>
Tensor<value_t> prod(const Tensor<value_t>& x,
                     const std::vector<int64_t>& axes = {});

/**
 * @brief Product of the non-zero elements along @p axes.
 *
 * Zero elements are skipped; a run of zeros only yields 1.
 */
template <typename value_t>
Tensor<value_t> prod_non_zeros(const Tensor<value_t>& x,
                               const std::vector<int64_t>& axes = {});

/**
 * @brief Smallest element along @p axes.
 * @throws validation_error if a reduced axis is empty.
 */
template <typename value_t>
Tensor<value_t> min(const Tensor<value_t>& x,
                    const std::vector<int64_t>& axes = {});

/**
 * @brief Largest element along @p axes.
 * @throws validation_error if a reduced axis is empty.
 */
template <typename value_t>
Tensor<value_t> max(const Tensor<value_t>& x,
                    const std::vector<int64_t>& axes = {});

/**
 * @brief Largest absolute value along @p axes.
 * @throws validation_error if a reduced axis is empty.
 */
template <typename value_t>
Tensor<value_t> absmax(const Tensor<value_t>& x,
                       const std::vector<int64_t>& axes = {});

/**
 * @brief Sum of absolute values along @p axes.
 */
template <typename value_t>
Tensor<value_t> abssum(const Tensor<value_t>& x,
                       const std::vector<int64_t>& axes = {});

/**
 * @brief Euclidean norm along @p axes.
 */
template <typename value_t>
Tensor<value_t> sqrt_sum_squares(const Tensor<value_t>& x,
                                 const std::vector<int64_t>& axes = {});

/**
 * @brief True where every element along @p axes is true.
 * @throws validation_error if a reduced axis is empty.
 */
Tensor<bool> all(const Tensor<bool>& x, const std::vector<int64_t>& axes = {});

/**
 * @brief True where any element along @p axes is true.
 * @throws validation_error if a reduced axis is empty.
 */
Tensor<bool> any(const Tensor<bool>& x, const std::vector<int64_t>& axes = {});

} // namespace stratum

#endif // STRATUM_REDUCTIONS_HPP
