/**
 * @file Utils.hpp
 * @brief General-purpose shape utility functions.
 *
 * Provides helpers for element counting, dense stride and divisor
 * computation in either traversal order, and reduction axis handling.
 */

#ifndef STRATUM_UTILS_HPP
#define STRATUM_UTILS_HPP

#include <algorithm>
#include <cstdint>
#include <limits>
#include <vector>

#include "Errors.hpp"

namespace stratum
{

/**
 * @brief Element order of a dense layout, and traversal order of a view.
 */
enum class Order
{
    ROW_MAJOR,  ///< last dimension varies fastest
    COL_MAJOR   ///< first dimension varies fastest
};

} // namespace stratum

namespace stratum::utils
{

/**
 * @brief Product of extents, with overflow guard.
 *
 * An empty shape (rank 0) describes a single element.
 *
 * @throws bounds_error if the product overflows uint64_t.
 */
inline uint64_t element_count(const std::vector<uint64_t>& shape)
{
    constexpr uint64_t U64_MAX = std::numeric_limits<uint64_t>::max();
    uint64_t total = 1;
    for (uint64_t d : shape)
    {
        if (d == 0)
        {
            return 0;
        }
        STRATUM_CHECK(total > U64_MAX / d, bounds_error,
            "element_count: total element count overflow");
        total *= d;
    }
    return total;
}

/**
 * @brief Dense strides of @p shape for the given element order.
 *
 * Zero extents are treated as one so strides stay meaningful
 * for empty views.
 */
inline std::vector<uint64_t>
compute_dense_strides(const std::vector<uint64_t>& shape, Order order)
{
    const int64_t rank = static_cast<int64_t>(shape.size());
    std::vector<uint64_t> strides(rank, 1);
    uint64_t running = 1;

    if (order == Order::ROW_MAJOR)
    {
        for (int64_t i = rank - 1; i >= 0; --i)
        {
            strides[i] = running;
            running *= std::max<uint64_t>(shape[i], 1);
        }
    }
    else
    {
        for (int64_t i = 0; i < rank; ++i)
        {
            strides[i] = running;
            running *= std::max<uint64_t>(shape[i], 1);
        }
    }
    return strides;
}

/**
 * @brief Precompute divisors for linear index translation.
 *
 * For a logical linear index `k` enumerated in @p order,
 * the coordinate along axis d is `(k / divisors[d]) % shape[d]`.
 *
 * @param shape The tensor shape.
 * @param order Enumeration order of the linear index.
 * @return A vector of divisors matching the rank.
 */
inline std::vector<uint64_t>
compute_divisors(const std::vector<uint64_t>& shape,
                 Order order = Order::ROW_MAJOR)
{
    return compute_dense_strides(shape, order);
}

/**
 * @brief Normalizes a reduction axis list.
 *
 * Negative axes count from the end, duplicates are dropped, and the
 * result is sorted. An empty list selects every axis.
 *
 * @throws bounds_error if an axis is outside [-rank, rank).
 */
inline std::vector<int64_t>
normalize_axes(const std::vector<int64_t>& axes, int64_t rank)
{
    std::vector<int64_t> out;
    if (axes.empty())
    {
        out.resize(rank);
        for (int64_t i = 0; i < rank; ++i)
        {
            out[i] = i;
        }
        return out;
    }

    out.reserve(axes.size());
    for (int64_t a : axes)
    {
        int64_t axis = a < 0 ? a + rank : a;
        STRATUM_CHECK(axis < 0 || axis >= rank, bounds_error,
            "normalize_axes: axis out of bounds");
        out.push_back(axis);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

/**
 * @brief Shape of a rank-preserving reduction along @p axes.
 *
 * Reduced extents become 1. @p axes must already be normalized.
 */
inline std::vector<uint64_t>
reduction_shape(const std::vector<uint64_t>& shape,
                const std::vector<int64_t>& axes)
{
    std::vector<uint64_t> out(shape);
    for (int64_t a : axes)
    {
        out[a] = 1;
    }
    return out;
}

} // namespace stratum::utils

#endif // STRATUM_UTILS_HPP
