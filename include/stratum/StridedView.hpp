/**
 * @file StridedView.hpp
 * @brief Declaration of the StridedView layout descriptor and its
 * lazy traversal sequences.
 */

#ifndef STRATUM_STRIDEDVIEW_HPP
#define STRATUM_STRIDEDVIEW_HPP

#include <cstdint>
#include <iterator>
#include <vector>

#include "Utils.hpp"

namespace stratum
{

class StridedSequence;

/**
 * @brief Maps a logical index space onto a physical element buffer.
 *
 * A view is a shape, a stride per axis (in elements), an origin offset
 * and a declared element order. Views are immutable; slicing, reshaping
 * and transposing produce new views over the same buffer.
 */
class StridedView
{

private:

    /// Member extents for each axis.
    std::vector<uint64_t> m_shape {};

    /// Member strides for each axis, in elements.
    std::vector<uint64_t> m_strides {};

    /// Member origin offset in the buffer, in elements.
    uint64_t              m_offset {0};

    /// Member declared element order.
    Order                 m_order {Order::ROW_MAJOR};

public:

    /**
     * @brief Empty rank-0 view.
     */
    StridedView() = default;

    /**
     * @brief Construct a view from explicit metadata.
     *
     * @throws validation_error if @p shape and @p strides differ in rank.
     */
    StridedView(std::vector<uint64_t> shape,
                std::vector<uint64_t> strides,
                uint64_t offset = 0,
                Order order = Order::ROW_MAJOR);

    /**
     * @brief Densely packed view of @p shape in @p order, at offset 0.
     */
    static StridedView dense(const std::vector<uint64_t>& shape,
                             Order order = Order::ROW_MAJOR);

    const std::vector<uint64_t>& get_shape() const noexcept;
    const std::vector<uint64_t>& get_strides() const noexcept;
    uint64_t get_offset() const noexcept;
    Order get_order() const noexcept;
    uint64_t get_rank() const noexcept;

    /**
     * @brief Number of logical elements (product of the shape).
     */
    uint64_t get_num_elements() const;

    /**
     * @brief One past the largest buffer offset the view can touch.
     *
     * Zero for an empty view.
     */
    uint64_t get_span() const;

    /**
     * @brief True if the view is densely packed in its declared order.
     *
     * Strides of extent-1 axes are ignored.
     */
    bool is_dense() const;

    /**
     * @brief Physical offset of a logical multi-index.
     *
     * @throws validation_error if @p coords does not match the rank.
     * @throws bounds_error if a coordinate is outside its extent.
     */
    uint64_t offset_of(const std::vector<uint64_t>& coords) const;

    /**
     * @brief Sub-view starting at @p start with extents @p extents.
     *
     * @throws validation_error on rank mismatch.
     * @throws bounds_error if the region exceeds the view.
     */
    StridedView slice(const std::vector<uint64_t>& start,
                      const std::vector<uint64_t>& extents) const;

    /**
     * @brief Reverses the axes and flips the declared order.
     */
    StridedView transpose() const;

    /**
     * @brief Permutes the axes; the declared order is kept.
     *
     * @throws validation_error if @p axes is not a permutation of the axes.
     */
    StridedView transpose(const std::vector<uint64_t>& axes) const;

    /**
     * @brief Dense view of the same elements with a new shape.
     *
     * @throws validation_error if the view is not dense or the element
     * count differs.
     */
    StridedView reshape(const std::vector<uint64_t>& new_shape) const;

    /**
     * @brief Expands extent-1 axes to @p shape with stride 0.
     *
     * @throws validation_error if ranks differ or an axis is neither
     * equal nor 1.
     */
    StridedView broadcast_to(const std::vector<uint64_t>& shape) const;

    /**
     * @brief Same view with a different declared order.
     */
    StridedView with_order(Order order) const;

    /**
     * @brief Logical traversal, last dimension fastest.
     */
    StridedSequence row_sequential() const;

    /**
     * @brief Logical traversal, first dimension fastest.
     */
    StridedSequence col_sequential() const;

    /**
     * @brief Logical traversal in @p order.
     */
    StridedSequence sequential(Order order) const;

    /**
     * @brief Traversal in the view's own declared order.
     */
    StridedSequence sequential() const;

    bool operator==(const StridedView& other) const;
    bool operator!=(const StridedView& other) const;
};

/**
 * @brief Lazy sequence of physical offsets visiting every element of a
 * view once, in a given logical order.
 *
 * The iterator keeps a multi-index counter and updates the offset
 * incrementally; no index arrays are materialized up front.
 */
class StridedSequence
{
public:

    class iterator
    {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = uint64_t;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const uint64_t*;
        using reference         = uint64_t;

        iterator() = default;

        uint64_t operator*() const noexcept { return m_offset; }

        iterator& operator++();

        iterator operator++(int)
        {
            iterator tmp = *this;
            ++(*this);
            return tmp;
        }

        bool operator==(const iterator& other) const noexcept
        {
            return m_remaining == other.m_remaining;
        }

        bool operator!=(const iterator& other) const noexcept
        {
            return !(*this == other);
        }

    private:
        friend class StridedSequence;

        iterator(const StridedSequence* p_seq, uint64_t remaining);

        const StridedSequence* m_p_seq {nullptr};
        std::vector<uint64_t>  m_coords {};
        uint64_t               m_offset {0};
        uint64_t               m_remaining {0};
    };

    StridedSequence(const StridedView& view, Order order);

    iterator begin() const;
    iterator end() const;

    uint64_t size() const noexcept { return m_count; }

private:
    std::vector<uint64_t> m_shape;
    std::vector<uint64_t> m_strides;
    uint64_t              m_offset;
    Order                 m_order;
    uint64_t              m_count;
};

} // namespace stratum

#endif // STRATUM_STRIDEDVIEW_HPP
