/**
 * @file SYCLUtils.hpp
 * @brief Small, inline helpers for use inside SYCL kernels.
 *
 * Kernels cannot capture `std::vector`, so view metadata is packed into a
 * fixed-capacity, trivially copyable KernelView before launch.
 */

#ifndef STRATUM_SYCLUTILS_HPP
#define STRATUM_SYCLUTILS_HPP

#include <sycl/sycl.hpp>
#include <cstdint>

#include "StridedView.hpp"

/// Largest rank a view may have to be used by an accelerator kernel.
#ifndef STRATUM_MAX_KERNEL_RANK
  #define STRATUM_MAX_KERNEL_RANK 8
#endif

namespace stratum::sycl_utils
{

/**
 * @brief Device-copyable view metadata.
 *
 * `divisors` enumerate the logical index space in the traversal order the
 * view was packed for (see make_kernel_view()).
 */
struct KernelView
{
    int64_t  rank;
    uint64_t offset;
    uint64_t shape[STRATUM_MAX_KERNEL_RANK];
    uint64_t divisors[STRATUM_MAX_KERNEL_RANK];
    uint64_t strides[STRATUM_MAX_KERNEL_RANK];
};

/**
 * @brief Packs @p view for a kernel enumerating indices in @p order.
 *
 * @throws layout_error if the view rank exceeds STRATUM_MAX_KERNEL_RANK.
 */
inline KernelView make_kernel_view(const StridedView& view, Order order)
{
    const uint64_t rank = view.get_rank();
    STRATUM_CHECK(rank > STRATUM_MAX_KERNEL_RANK,
        layout_error,
        R"(make_kernel_view: layout combination not implemented
            (view rank exceeds the kernel rank limit).)");

    const std::vector<uint64_t> divs =
        utils::compute_divisors(view.get_shape(), order);

    KernelView kv {};
    kv.rank = static_cast<int64_t>(rank);
    kv.offset = view.get_offset();
    for (uint64_t d = 0; d < rank; ++d)
    {
        kv.shape[d] = view.get_shape()[d];
        kv.divisors[d] = divs[d];
        kv.strides[d] = view.get_strides()[d];
    }
    return kv;
}

/**
 * @brief Map a logical linear index to a physical offset.
 *
 * @param logical_idx linear index (0..N-1) in the packed traversal order
 * @param kv packed view
 * @return offset into the underlying flat data buffer
 */
inline uint64_t idx_of(uint64_t logical_idx, const KernelView& kv)
{
    uint64_t off = kv.offset;
    for (int64_t d = 0; d < kv.rank; ++d)
    {
        const uint64_t extent = kv.shape[d];
        uint64_t coord = 0;
        if (extent > 1)
        {
            coord = (logical_idx / kv.divisors[d]) % extent;
        }
        off += coord * kv.strides[d];
    }
    return off;
}

} // namespace stratum::sycl_utils

#endif // STRATUM_SYCLUTILS_HPP
