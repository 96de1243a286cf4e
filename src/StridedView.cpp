/**
 * @file StridedView.cpp
 * @brief StridedView and StridedSequence definitions.
 */

#include "stratum/StridedView.hpp"

#include <utility>

namespace stratum
{

StridedView::StridedView(std::vector<uint64_t> shape,
                         std::vector<uint64_t> strides,
                         uint64_t offset,
                         Order order)
    : m_shape(std::move(shape)),
      m_strides(std::move(strides)),
      m_offset(offset),
      m_order(order)
{
    STRATUM_CHECK(m_shape.size() != m_strides.size(),
        validation_error,
        R"(StridedView(constructor):
            shape and strides must have the same rank.)");
}

StridedView StridedView::dense(const std::vector<uint64_t>& shape,
                               Order order)
{
    return StridedView(shape,
        utils::compute_dense_strides(shape, order), 0, order);
}

const std::vector<uint64_t>& StridedView::get_shape() const noexcept
{
    return m_shape;
}

const std::vector<uint64_t>& StridedView::get_strides() const noexcept
{
    return m_strides;
}

uint64_t StridedView::get_offset() const noexcept
{
    return m_offset;
}

Order StridedView::get_order() const noexcept
{
    return m_order;
}

uint64_t StridedView::get_rank() const noexcept
{
    return static_cast<uint64_t>(m_shape.size());
}

uint64_t StridedView::get_num_elements() const
{
    return utils::element_count(m_shape);
}

uint64_t StridedView::get_span() const
{
    if (get_num_elements() == 0)
    {
        return 0;
    }
    uint64_t last = m_offset;
    for (uint64_t d = 0; d < get_rank(); ++d)
    {
        last += (m_shape[d] - 1) * m_strides[d];
    }
    return last + 1;
}

bool StridedView::is_dense() const
{
    const std::vector<uint64_t> expected =
        utils::compute_dense_strides(m_shape, m_order);
    for (uint64_t d = 0; d < get_rank(); ++d)
    {
        if (m_shape[d] > 1 && m_strides[d] != expected[d])
        {
            return false;
        }
    }
    return true;
}

uint64_t StridedView::offset_of(const std::vector<uint64_t>& coords) const
{
    STRATUM_CHECK(coords.size() != m_shape.size(),
        validation_error,
        R"(StridedView(offset_of): coords must match view rank.)");

    uint64_t off = m_offset;
    for (uint64_t d = 0; d < get_rank(); ++d)
    {
        STRATUM_CHECK(coords[d] >= m_shape[d],
            bounds_error,
            R"(StridedView(offset_of): coordinate out of bounds.)");
        off += coords[d] * m_strides[d];
    }
    return off;
}

StridedView StridedView::slice(const std::vector<uint64_t>& start,
                               const std::vector<uint64_t>& extents) const
{
    STRATUM_CHECK(start.size() != m_shape.size() ||
        extents.size() != m_shape.size(),
        validation_error,
        R"(StridedView(slice): start and extents must match view rank.)");

    uint64_t off = m_offset;
    for (uint64_t d = 0; d < get_rank(); ++d)
    {
        STRATUM_CHECK(start[d] > m_shape[d] ||
            extents[d] > m_shape[d] - start[d],
            bounds_error,
            R"(StridedView(slice): region out of bounds.)");
        if (extents[d] > 0)
        {
            off += start[d] * m_strides[d];
        }
    }
    return StridedView(extents, m_strides, off, m_order);
}

StridedView StridedView::transpose() const
{
    std::vector<uint64_t> shape(m_shape.rbegin(), m_shape.rend());
    std::vector<uint64_t> strides(m_strides.rbegin(), m_strides.rend());

    Order flipped;
    if (m_order == Order::ROW_MAJOR)
    {
        flipped = Order::COL_MAJOR;
    }
    else
    {
        flipped = Order::ROW_MAJOR;
    }
    return StridedView(std::move(shape), std::move(strides), m_offset, flipped);
}

StridedView StridedView::transpose(const std::vector<uint64_t>& axes) const
{
    const uint64_t rank = get_rank();
    STRATUM_CHECK(axes.size() != rank,
        validation_error,
        R"(StridedView(transpose): axes must match view rank.)");

    std::vector<bool> seen(rank, false);
    std::vector<uint64_t> shape(rank);
    std::vector<uint64_t> strides(rank);
    for (uint64_t i = 0; i < rank; ++i)
    {
        STRATUM_CHECK(axes[i] >= rank || seen[axes[i]],
            validation_error,
            R"(StridedView(transpose): axes must be a permutation.)");
        seen[axes[i]] = true;
        shape[i] = m_shape[axes[i]];
        strides[i] = m_strides[axes[i]];
    }
    return StridedView(std::move(shape), std::move(strides), m_offset, m_order);
}

StridedView StridedView::reshape(const std::vector<uint64_t>& new_shape) const
{
    STRATUM_CHECK(!is_dense(),
        validation_error,
        R"(StridedView(reshape): only dense views can be reshaped.)");

    STRATUM_CHECK(utils::element_count(new_shape) != get_num_elements(),
        validation_error,
        R"(StridedView(reshape): element count must not change.)");

    StridedView out = dense(new_shape, m_order);
    out.m_offset = m_offset;
    return out;
}

StridedView StridedView::broadcast_to(const std::vector<uint64_t>& shape) const
{
    STRATUM_CHECK(shape.size() != m_shape.size(),
        validation_error,
        R"(StridedView(broadcast_to): rank mismatch.)");

    std::vector<uint64_t> strides(m_strides);
    for (uint64_t d = 0; d < get_rank(); ++d)
    {
        if (m_shape[d] == shape[d])
        {
            continue;
        }
        STRATUM_CHECK(m_shape[d] != 1,
            validation_error,
            R"(StridedView(broadcast_to): incompatible extents.)");
        strides[d] = 0;
    }
    return StridedView(shape, std::move(strides), m_offset, m_order);
}

StridedView StridedView::with_order(Order order) const
{
    StridedView out(*this);
    out.m_order = order;
    return out;
}

StridedSequence StridedView::row_sequential() const
{
    return StridedSequence(*this, Order::ROW_MAJOR);
}

StridedSequence StridedView::col_sequential() const
{
    return StridedSequence(*this, Order::COL_MAJOR);
}

StridedSequence StridedView::sequential(Order order) const
{
    return StridedSequence(*this, order);
}

StridedSequence StridedView::sequential() const
{
    return StridedSequence(*this, m_order);
}

bool StridedView::operator==(const StridedView& other) const
{
    return m_shape == other.m_shape && m_strides == other.m_strides &&
        m_offset == other.m_offset && m_order == other.m_order;
}

bool StridedView::operator!=(const StridedView& other) const
{
    return !(*this == other);
}

StridedSequence::StridedSequence(const StridedView& view, Order order)
    : m_shape(view.get_shape()),
      m_strides(view.get_strides()),
      m_offset(view.get_offset()),
      m_order(order),
      m_count(view.get_num_elements())
{
}

StridedSequence::iterator StridedSequence::begin() const
{
    return iterator(this, m_count);
}

StridedSequence::iterator StridedSequence::end() const
{
    return iterator(this, 0);
}

StridedSequence::iterator::iterator(const StridedSequence* p_seq,
                                    uint64_t remaining)
    : m_p_seq(p_seq),
      m_offset(p_seq->m_offset),
      m_remaining(remaining)
{
    if (m_remaining > 0)
    {
        m_coords.assign(p_seq->m_shape.size(), 0);
    }
}

StridedSequence::iterator& StridedSequence::iterator::operator++()
{
    if (m_remaining == 0)
    {
        return *this;
    }
    --m_remaining;
    if (m_remaining == 0)
    {
        return *this;
    }

    const std::vector<uint64_t>& shape = m_p_seq->m_shape;
    const std::vector<uint64_t>& strides = m_p_seq->m_strides;
    const int64_t rank = static_cast<int64_t>(shape.size());

    // Carry through the axes, fastest first.
    for (int64_t i = 0; i < rank; ++i)
    {
        int64_t d;
        if (m_p_seq->m_order == Order::ROW_MAJOR)
        {
            d = rank - 1 - i;
        }
        else
        {
            d = i;
        }

        ++m_coords[d];
        m_offset += strides[d];
        if (m_coords[d] < shape[d])
        {
            break;
        }
        m_offset -= strides[d] * shape[d];
        m_coords[d] = 0;
    }
    return *this;
}

} // namespace stratum
