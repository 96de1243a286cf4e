/**
 * @file Tensor.cpp
 * @brief Tensor class function definitions.
 */

#include "stratum/Tensor.hpp"
#include "stratum/Errors.hpp"
#include "stratum/MapOps.hpp"
#include "stratum/Platform.hpp"
#include "stratum/Utils.hpp"

#include <limits>
#include <utility>

namespace stratum
{

namespace
{

template <typename value_t>
uint64_t checked_byte_count(uint64_t element_count)
{
    constexpr uint64_t U64_MAX = std::numeric_limits<uint64_t>::max();
    const uint64_t elem_size = static_cast<uint64_t>(sizeof(value_t));

    STRATUM_CHECK(element_count > U64_MAX / elem_size,
        bounds_error,
        R"(Tensor(main constructor): allocation size (bytes) overflow.)");

    const uint64_t bytes = element_count * elem_size;
    const uint64_t max_size_t_u64 = static_cast<uint64_t>
        (std::numeric_limits<size_t>::max());

    STRATUM_CHECK(bytes > max_size_t_u64,
        bounds_error,
        R"(Tensor(main constructor): allocation size
            (bytes) doesn't fit into size_t on this platform.)");

    return bytes;
}

} // namespace

template<typename value_t>
Tensor<value_t>::Tensor(const std::vector<uint64_t>& shape, Order order)
    : m_view(StridedView::dense(shape, order))
{
    const uint64_t bytes =
        checked_byte_count<value_t>(utils::element_count(shape));
    m_p_storage = std::make_shared<TensorStorage>(bytes);
}

template<typename value_t>
Tensor<value_t>::Tensor(const std::vector<uint64_t>& shape,
                        const std::vector<value_t>& values,
                        Order order)
    : Tensor(shape, order)
{
    *this = values;
}

template<typename value_t>
Tensor<value_t>::Tensor(std::shared_ptr<TensorStorage> storage,
                        StridedView view)
    : m_p_storage(std::move(storage)),
      m_view(std::move(view))
{
    STRATUM_CHECK(!m_p_storage,
        validation_error,
        R"(Tensor(view constructor): null storage.)");

    const uint64_t needed = checked_byte_count<value_t>(m_view.get_span());
    STRATUM_CHECK(needed > m_p_storage->get_byte_count(),
        bounds_error,
        R"(Tensor(view constructor): view exceeds the storage.)");
}

template<typename value_t>
Tensor<value_t> Tensor<value_t>::scalar(value_t value)
{
    return Tensor(std::vector<uint64_t>{}, std::vector<value_t>{value});
}

template<typename value_t>
Tensor<value_t> Tensor<value_t>::clone() const
{
    Tensor result(get_shape(), get_order());
    map_op(current_queue(), *this, result,
        [](value_t v) { return v; });
    return result;
}

template<typename value_t>
Tensor<value_t>& Tensor<value_t>::operator=(const std::vector<value_t>& values)
{
    STRATUM_CHECK(values.size() != get_num_elements(),
        validation_error,
        R"(Tensor(operator=): value count does not match the shape.)");

    DeviceQueue& q = Platform::get().sync_queue();
    std::shared_ptr<DeviceMemory> mem = read_write(q);
    value_t* p_data = static_cast<value_t*>(mem->get_data());

    uint64_t i = 0;
    for (uint64_t off : m_view.row_sequential())
    {
        p_data[off] = values[i++];
    }
    return *this;
}

template<typename value_t>
std::vector<value_t> Tensor<value_t>::to_vector() const
{
    DeviceQueue& q = Platform::get().sync_queue();
    std::shared_ptr<const DeviceMemory> mem = read(q);
    const value_t* p_data = static_cast<const value_t*>(mem->get_data());

    std::vector<value_t> out;
    out.reserve(static_cast<size_t>(get_num_elements()));
    for (uint64_t off : m_view.row_sequential())
    {
        out.push_back(p_data[off]);
    }
    return out;
}

template<typename value_t>
value_t Tensor<value_t>::item() const
{
    STRATUM_CHECK(get_num_elements() != 1,
        validation_error,
        R"(Tensor(item): tensor must hold exactly one element.)");

    return to_vector()[0];
}

template<typename value_t>
Tensor<value_t> Tensor<value_t>::slice(const std::vector<uint64_t>& start,
                                       const std::vector<uint64_t>& extents) const
{
    return Tensor(m_p_storage, m_view.slice(start, extents));
}

template<typename value_t>
Tensor<value_t> Tensor<value_t>::transpose() const
{
    return Tensor(m_p_storage, m_view.transpose());
}

template<typename value_t>
Tensor<value_t>
Tensor<value_t>::transpose(const std::vector<uint64_t>& axes) const
{
    return Tensor(m_p_storage, m_view.transpose(axes));
}

template<typename value_t>
Tensor<value_t>
Tensor<value_t>::reshape(const std::vector<uint64_t>& new_shape) const
{
    return Tensor(m_p_storage, m_view.reshape(new_shape));
}

template<typename value_t>
std::shared_ptr<const DeviceMemory>
Tensor<value_t>::read(DeviceQueue& queue) const
{
    STRATUM_CHECK(!m_p_storage,
        validation_error,
        R"(Tensor(read): tensor has no storage.)");

    return m_p_storage->read(queue);
}

template<typename value_t>
std::shared_ptr<DeviceMemory>
Tensor<value_t>::read_write(DeviceQueue& queue) const
{
    STRATUM_CHECK(!m_p_storage,
        validation_error,
        R"(Tensor(read_write): tensor has no storage.)");

    return m_p_storage->read_write(queue);
}

template<typename value_t>
const StridedView& Tensor<value_t>::get_view() const noexcept
{
    return m_view;
}

template<typename value_t>
const std::vector<uint64_t>& Tensor<value_t>::get_shape() const noexcept
{
    return m_view.get_shape();
}

template<typename value_t>
const std::vector<uint64_t>& Tensor<value_t>::get_strides() const noexcept
{
    return m_view.get_strides();
}

template<typename value_t>
uint64_t Tensor<value_t>::get_rank() const noexcept
{
    return m_view.get_rank();
}

template<typename value_t>
uint64_t Tensor<value_t>::get_num_elements() const
{
    return m_view.get_num_elements();
}

template<typename value_t>
Order Tensor<value_t>::get_order() const noexcept
{
    return m_view.get_order();
}

template<typename value_t>
const std::shared_ptr<TensorStorage>&
Tensor<value_t>::get_storage() const noexcept
{
    return m_p_storage;
}

template<typename value_t>
bool Tensor<value_t>::shares_storage(const Tensor& other) const noexcept
{
    return m_p_storage && m_p_storage == other.m_p_storage;
}

template class Tensor<float>;
template class Tensor<double>;
template class Tensor<int32_t>;
template class Tensor<bool>;

} // namespace stratum
