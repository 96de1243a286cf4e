/**
 * @file Tensor.hpp
 * @brief Declaration of the Tensor data structure.
 */

#ifndef STRATUM_TENSOR_HPP
#define STRATUM_TENSOR_HPP

#include <vector>
#include <cstdint>
#include <memory>

#include "DeviceQueue.hpp"
#include "Storage.hpp"
#include "StridedView.hpp"

namespace stratum
{

/**
 * @brief Class template for the Tensor data structure.
 * @tparam value_t Element type (float, double, int32_t, bool).
 *
 * A tensor is a StridedView over a shared TensorStorage. Copies are
 * shallow: they alias the storage, exactly like slices and transposes.
 * clone() produces an independent dense copy.
 *
 * Element access from the host (to_vector(), item(), assignment from a
 * vector) goes through the Platform sync queue and therefore waits for
 * every queue that produced the data.
 */
template <typename value_t>
class Tensor
{

private:

    /// Member shared element storage.
    std::shared_ptr<TensorStorage> m_p_storage {};

    /// Member layout of this tensor inside the storage.
    StridedView                    m_view {};

public:

    /**
     * @brief Tensor default class constructor.
     *
     * Produces an empty tensor with no storage.
     */
    Tensor() = default;

    /**
     * @brief Construct a zero-filled tensor of the given shape.
     *
     * Storage is allocated lazily on the first queue that touches it.
     *
     * @param shape Extents of each axis; an empty shape is a scalar.
     * @param order Element order of the dense layout.
     *
     * @throws bounds_error if the byte size overflows.
     */
    explicit Tensor(const std::vector<uint64_t>& shape,
                    Order order = Order::ROW_MAJOR);

    /**
     * @brief Construct a tensor and fill it from @p values.
     *
     * @p values are given in logical row-major order whatever the
     * element @p order of the layout.
     *
     * @throws validation_error if the value count does not match.
     */
    Tensor(const std::vector<uint64_t>& shape,
           const std::vector<value_t>& values,
           Order order = Order::ROW_MAJOR);

    /**
     * @brief View constructor.
     *
     * @throws validation_error if @p storage is null.
     * @throws bounds_error if @p view reaches past the end of @p storage.
     */
    Tensor(std::shared_ptr<TensorStorage> storage, StridedView view);

    /**
     * @brief Rank-0 tensor holding @p value.
     */
    static Tensor scalar(value_t value);

    /**
     * @brief Deep copy into a new dense tensor with the same element
     * order.
     *
     * The copy is queued on the current queue.
     */
    Tensor clone() const;

    /**
     * @brief Assign @p values, in logical row-major order.
     *
     * Writes through the sync queue into the existing storage.
     *
     * @throws validation_error if the value count does not match.
     */
    Tensor& operator=(const std::vector<value_t>& values);

    /**
     * @brief Read all elements in logical row-major order.
     */
    std::vector<value_t> to_vector() const;

    /**
     * @brief Read the single element of a one-element tensor.
     * @throws validation_error if the tensor has more than one element.
     */
    value_t item() const;

    /**
     * @brief Sub-tensor aliasing this tensor's storage.
     * @throws bounds_error if the region exceeds the tensor.
     */
    Tensor slice(const std::vector<uint64_t>& start,
                 const std::vector<uint64_t>& extents) const;

    /**
     * @brief Reverse the axes; the element order flips.
     */
    Tensor transpose() const;

    /**
     * @brief Permute the axes.
     * @throws validation_error if @p axes is not a permutation.
     */
    Tensor transpose(const std::vector<uint64_t>& axes) const;

    /**
     * @brief Dense view with a new shape.
     * @throws validation_error if the tensor is not dense or the element
     * count differs.
     */
    Tensor reshape(const std::vector<uint64_t>& new_shape) const;

    /**
     * @brief Replica of the elements readable by work on @p queue.
     */
    std::shared_ptr<const DeviceMemory> read(DeviceQueue& queue) const;

    /**
     * @brief Replica of the elements writable by work on @p queue.
     */
    std::shared_ptr<DeviceMemory> read_write(DeviceQueue& queue) const;

    const StridedView& get_view() const noexcept;
    const std::vector<uint64_t>& get_shape() const noexcept;
    const std::vector<uint64_t>& get_strides() const noexcept;
    uint64_t get_rank() const noexcept;
    uint64_t get_num_elements() const;
    Order get_order() const noexcept;

    /**
     * @brief Shared storage, null for a default-constructed tensor.
     */
    const std::shared_ptr<TensorStorage>& get_storage() const noexcept;

    /**
     * @brief True if both tensors alias one storage.
     */
    bool shares_storage(const Tensor& other) const noexcept;
};

} // namespace stratum

#endif // STRATUM_TENSOR_HPP
